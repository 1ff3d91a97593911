#include "ddsync/content/ignore_rules.hpp"

#include <fnmatch.h>
#include <spdlog/spdlog.h>

#include <fstream>

namespace fs = std::filesystem;

namespace ddsync::content {

Result<IgnoreRules> IgnoreRules::create(const std::string& exclude_regex) {
    IgnoreRules rules;
    if (!exclude_regex.empty()) {
        try {
            rules.name_regex_ = std::regex(exclude_regex);
            rules.has_regex_ = true;
        } catch (const std::regex_error& e) {
            return Err<IgnoreRules>(Error::validation(
                "invalid exclude regex '" + exclude_regex + "': " + e.what()));
        }
    }
    return Ok(std::move(rules));
}

Result<void> IgnoreRules::load_directory(const fs::path& directory) {
    const fs::path ignore_file = directory / kIgnoreFileName;
    std::error_code ec;
    if (!fs::is_regular_file(ignore_file, ec)) {
        return Ok();
    }

    std::ifstream in(ignore_file);
    if (!in) {
        return Err<void>(Error::filesystem("cannot read " + ignore_file.string()));
    }

    std::string line;
    size_t added = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        patterns_.push_back((directory / line).lexically_normal().string());
        ++added;
    }
    spdlog::debug("Loaded {} ignore pattern(s) from {}", added, ignore_file.string());
    return Ok();
}

bool IgnoreRules::is_excluded(const fs::path& entry) const {
    const std::string name = entry.filename().string();
    if (has_regex_ && std::regex_search(name, name_regex_)) {
        return true;
    }

    const std::string full = entry.lexically_normal().string();
    for (const auto& pattern : patterns_) {
        if (::fnmatch(pattern.c_str(), full.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace ddsync::content
