#pragma once

#include <polyexec/common/error_types.hpp>
#include <polyexec/language.hpp>
#include <polyexec/profiles/language_profile.hpp>

#include <functional>
#include <map>
#include <vector>

namespace polyexec {

/// Mapping from a language to its LanguageProfile.
///
/// Populated once at start (see `with_defaults`), optionally extended with `insert` before it is
/// shared, and read-only from then on. Concurrent `resolve` calls are safe as long as nothing
/// inserts.
class ProfileRegistry
{
public:
    ProfileRegistry() = default;

    /// The built-in table of containerized languages
    static ProfileRegistry with_defaults();

    /// Adds or replaces the profile for `profile.language`
    void insert(LanguageProfile profile);

    /// Fails with ErrorKind::UnsupportedLanguage if `lang` has no registered profile
    Result<std::reference_wrapper<const LanguageProfile>> resolve(Language lang) const;

    bool contains(Language lang) const;

    std::vector<Language> supported_languages() const;

    std::size_t size() const { return profiles_.size(); }

private:
    std::map<Language, LanguageProfile> profiles_;
};

} // namespace polyexec
