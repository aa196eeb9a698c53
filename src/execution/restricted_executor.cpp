#include <polyexec/execution/restricted_executor.hpp>

#include <polyexec/execution/raw_outcome.hpp>
#include <polyexec/logging.hpp>
#include <polyexec/subprocess/subprocess.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polyexec {

namespace {

/// Runs as the interpreter's `-c` program. argv[1] and argv[2] are the comma separated builtin and
/// module allowlists; the program source arrives on stdin.
///
/// Imported modules are handed out as views holding only their public, non-module attributes
/// (allowed submodules are viewed recursively), so `import random; random._os` has nothing to find.
/// Attributes that lead from an object back to frames, globals or the type system are rejected
/// before anything runs, including those named by format fields in string literals.
///
/// Whatever the program reaches, an audit hook installed before it runs refuses process creation,
/// networking, filesystem changes and reads outside the interpreter's own library directories.
constexpr std::string_view PRELUDE = R"py(
import _string
import ast
import os
import sys
import traceback
import types
import builtins as _builtins

_allowed_builtins = [name for name in sys.argv[1].split(',') if name]
_allowed_modules = frozenset(name for name in sys.argv[2].split(',') if name)
_forbidden_names = frozenset((
    '__builtins__', '__import__', '__loader__', '__spec__', '__class__', '__bases__', '__base__',
    '__mro__', '__subclasses__', '__globals__', '__code__', '__closure__', '__dict__',
    '__getattribute__', '__reduce__', '__reduce_ex__', '__func__', '__self__', '__traceback__',
    '__defaults__', '__kwdefaults__', '__init_subclass__', '__subclasshook__',
    'gi_frame', 'gi_code', 'cr_frame', 'cr_code', 'ag_frame', 'ag_code', 'tb_frame', 'tb_next',
    'f_globals', 'f_locals', 'f_builtins', 'f_back', 'f_code', 'co_code', 'mro',
))
# Public attributes that still look attributes up by name
_withheld = {'string': frozenset(('Formatter',))}
_real_import = _builtins.__import__
_views = {}


def _public_view(module):
    view = _views.get(id(module))
    if view is not None:
        return view
    view = types.ModuleType(module.__name__)
    _views[id(module)] = view
    withheld = _withheld.get(module.__name__, frozenset())
    for key in dir(module):
        if key.startswith('_') or key in withheld:
            continue
        value = getattr(module, key)
        if isinstance(value, types.ModuleType):
            if value.__name__.partition('.')[0] not in _allowed_modules:
                continue
            value = _public_view(value)
        setattr(view, key, value)
    return view


def _guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
    if level != 0 or name.partition('.')[0] not in _allowed_modules:
        raise ImportError(f"import of '{name}' is not allowed")
    return _public_view(_real_import(name, globals, locals, fromlist, level))


def _check_format_fields(text):
    try:
        parsed = list(_string.formatter_parser(text))
    except ValueError:
        return
    for _, field, spec, _ in parsed:
        if field:
            _, rest = _string.formatter_field_name_split(field)
            for is_attr, key in rest:
                if is_attr and (key in _forbidden_names or key.startswith('__')):
                    raise PermissionError(f"access to attribute '{key}' is not allowed")
        if spec:
            _check_format_fields(spec)


def _check(tree):
    for node in ast.walk(tree):
        if isinstance(node, ast.Attribute) and node.attr in _forbidden_names:
            raise PermissionError(f"access to attribute '{node.attr}' is not allowed")
        if isinstance(node, ast.Name) and node.id in _forbidden_names:
            raise PermissionError(f"access to name '{node.id}' is not allowed")
        if isinstance(node, ast.Constant) and isinstance(node.value, str):
            _check_format_fields(node.value)


def _make_audit_hook(readable_dirs):
    denied = (
        'os.system', 'os.exec', 'os.posix_spawn', 'os.spawn', 'os.fork', 'os.kill', 'os.startfile',
        'subprocess.', 'pty.', 'socket.', 'ctypes.', 'shutil.', 'webbrowser.', 'urllib.', 'http.',
        'os.remove', 'os.unlink', 'os.rename', 'os.replace', 'os.rmdir', 'os.mkdir', 'os.chmod',
        'os.chown', 'os.chflags', 'os.link', 'os.symlink', 'os.truncate', 'os.utime', 'os.chdir',
        'os.putenv', 'os.unsetenv', 'os.setxattr', 'os.removexattr', 'os.getxattr', 'os.listxattr',
        'sys.settrace', 'sys.setprofile', 'gc.get_objects', 'gc.get_referrers', 'gc.get_referents',
        'code.__new__', 'marshal.',
    )
    path_events = frozenset(('open', 'os.listdir', 'os.scandir'))
    write_flags = os.O_WRONLY | os.O_RDWR | os.O_CREAT | os.O_TRUNC | os.O_APPEND
    fsdecode = os.fsdecode
    normpath = os.path.normpath
    sep = os.sep

    def readable(path):
        try:
            path = normpath(fsdecode(path))
        except (TypeError, ValueError):
            return False
        return any(path == top or path.startswith(top + sep) for top in readable_dirs)

    def hook(event, args):
        if event.startswith(denied):
            raise PermissionError(f"operation '{event}' is not allowed")
        if event not in path_events:
            return
        path = args[0] if args else None
        if event == 'open':
            mode, flags = args[1], args[2]
            writing = (mode is not None and any(c in mode for c in 'wax+')) or bool((flags or 0) & write_flags)
            if writing or not (isinstance(path, int) or readable(path)):
                raise PermissionError(f"opening {path!r} is not allowed")
        elif not readable(path):
            raise PermissionError(f"listing {path!r} is not allowed")

    return hook


# Load what the program may import while the filesystem is still open to the loader
for _name in sorted(_allowed_modules):
    try:
        _real_import(_name)
    except ImportError:
        pass

_safe_builtins = {name: getattr(_builtins, name) for name in _allowed_builtins if hasattr(_builtins, name)}
_safe_builtins['__import__'] = _guarded_import
_globals = {'__builtins__': _safe_builtins, '__name__': '__main__', '__doc__': None}

_source = sys.stdin.read()

sys.addaudithook(_make_audit_hook(tuple(os.path.normpath(p) for p in sys.path if p and os.path.isabs(p))))

try:
    _tree = ast.parse(_source, '<source>', 'exec')
    _check(_tree)
    exec(compile(_tree, '<source>', 'exec'), _globals)
except BaseException as _error:
    sys.stdout.flush()
    sys.stderr.write(''.join(traceback.format_exception_only(type(_error), _error)))
    sys.stderr.flush()
    sys.exit(1)
)py";

/// Host variables the interpreter may see; everything else is withheld from untrusted code
constexpr std::array ENV_PASSTHROUGH{"PATH", "HOME", "LANG", "LC_ALL", "TZ"};

std::string join_csv(const std::vector<std::string>& items) {
    return fmt::format("{}", fmt::join(items, ","));
}

std::vector<std::string> make_child_env() {
    std::vector<std::string> env;
    bool has_lang = false;

    for (const char* name : ENV_PASSTHROUGH) {
        const char* value = std::getenv(name); // NOLINT(concurrency-mt-unsafe)
        if (value != nullptr) {
            env.push_back(fmt::format("{}={}", name, value));
            has_lang = has_lang || std::string_view{name} == "LANG";
        }
    }

    if (!has_lang) {
        env.emplace_back("LANG=C.UTF-8");
    }

    return env;
}

} // namespace

RestrictedPolicy RestrictedPolicy::defaults() {
    return {
        .allowed_builtins =
            {
                // clang-format off
                "print", "len", "range", "list", "dict", "tuple", "set", "frozenset", "str", "int", "float",
                "bool", "complex", "bytes", "bytearray", "max", "min", "sum", "sorted", "reversed",
                "enumerate", "zip", "map", "filter", "abs", "round", "pow", "divmod", "any", "all",
                "isinstance", "issubclass", "chr", "ord", "repr", "format", "hash", "iter", "next", "slice",
                "hex", "oct", "bin", "object", "super", "property", "staticmethod", "classmethod",
                "__build_class__", "NotImplemented", "Ellipsis",
                "BaseException", "Exception", "ArithmeticError", "AssertionError", "AttributeError",
                "IndexError", "KeyError", "LookupError", "NameError", "NotImplementedError",
                "OverflowError", "RecursionError", "RuntimeError", "StopIteration", "TypeError",
                "ValueError", "ZeroDivisionError",
                // clang-format on
            },
        .allowed_modules =
            {
                // No `operator` (attrgetter, methodcaller) or `typing` (evaluates annotation strings):
                // both reach attributes by name at run time
                "math", "cmath", "random", "string", "itertools", "functools", "collections", "heapq", "bisect",
                "decimal", "fractions", "statistics", "datetime", "re", "json", "copy", "enum", "dataclasses",
            },
        .address_space_bytes = 512ULL * 1024 * 1024,
        .open_files = 64,
    };
}

RestrictedExecutor::RestrictedExecutor(const EngineConfig& config, RestrictedPolicy policy)
    : config_{config}
    , policy_{std::move(policy)} {}

Expected<ExecutionResult, ExecutionError> RestrictedExecutor::execute(const ExecutionRequest& request) {
    if (request.language != Language::Python) {
        return ExecutionError{ErrorKind::UnsupportedLanguage,
                              fmt::format("{} only runs python, not {}", get_name(), request.language)};
    }

    return run(request.source, request.timeout.value_or(ExecutionRequest::DEFAULT_TIMEOUT));
}

Expected<void, ExecutionError> RestrictedExecutor::check_availability() {
    if (!find_executable(config_.python_binary)) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("python interpreter {:?} was not found", config_.python_binary)};
    }

    return {};
}

std::vector<std::string> RestrictedExecutor::make_interpreter_args() const {
    // -I: isolated from the user's site and PYTHON* variables, -S: no site module,
    // -B: no bytecode files, -u: unbuffered so partial output survives a kill
    return {"-I", "-S", "-B", "-u", "-X", "utf8", "-c", std::string{PRELUDE}, join_csv(policy_.allowed_builtins),
            join_csv(policy_.allowed_modules)};
}

SubprocessOptions RestrictedExecutor::make_subprocess_options(std::chrono::milliseconds timeout) const {
    // One spare CPU second so the wall-clock deadline normally fires first
    auto cpu_seconds = std::chrono::ceil<std::chrono::seconds>(timeout).count() + 1;

    return {
        .env = make_child_env(),
        .new_process_group = true,
        .capture_limit = config_.capture_limit,
        .limits =
            {
                .address_space_bytes = policy_.address_space_bytes,
                .cpu_seconds = static_cast<rlim_t>(cpu_seconds),
                .file_size_bytes = 0,
                .open_files = policy_.open_files,
                .processes = std::nullopt,
                .no_new_privs = true,
                .parent_death_signal = SIGKILL,
            },
    };
}

Expected<ExecutionResult, ExecutionError> RestrictedExecutor::run(std::string_view source,
                                                                  std::chrono::milliseconds timeout) {
    using std::chrono::steady_clock;

    const auto start_time = steady_clock::now();
    const auto deadline = start_time + timeout;

    auto interpreter = find_executable(config_.python_binary);
    if (!interpreter) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("python interpreter {:?} was not found", config_.python_binary)};
    }

    Subprocess child{interpreter->string(), make_interpreter_args(), make_subprocess_options(timeout)};

    if (!child.start()) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("cannot start python interpreter {}", *interpreter)};
    }

    // A child that dies early closes its stdin; what it printed explains why, so keep going
    if (auto res = child.send_stdin(source); !res) {
        LOG_DEBUG("Could not send the whole source to the interpreter: {}", res.error());
    }
    if (auto res = child.close_stdin(); !res) {
        LOG_DEBUG("Could not close the interpreter's stdin: {}", res.error());
    }

    RestrictedRawOutcome raw;

    auto status = child.wait_until(deadline);

    if (!status && status.error() == ErrorKind::TimedOut) {
        LOG_DEBUG("Restricted program exceeded {}ms, killing it", timeout.count());

        if (auto res = child.kill(); !res) {
            return ExecutionError{ErrorKind::InfrastructureError,
                                  fmt::format("cannot kill timed out interpreter: {}", res.error())};
        }

        raw.run = CommandOutcome{
            .exit_code = std::nullopt,
            .stdout_capture = child.get_stdout(),
            .stderr_capture = child.get_stderr(),
            .timed_out = true,
        };
    } else if (!status) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("waiting for the interpreter failed: {}", status.error())};
    } else if (child.exec_failed()) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("cannot run python interpreter {}: {}", *interpreter,
                                          child.get_stderr().data)};
    } else {
        raw.run = CommandOutcome{
            .exit_code = status->get_shell_code(),
            .stdout_capture = child.get_stdout(),
            .stderr_capture = child.get_stderr(),
            .timed_out = false,
        };
    }

    raw.elapsed = steady_clock::now() - start_time;

    return normalize(raw);
}

} // namespace polyexec
