#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// A package version: up to four numeric components, an optional "-label"
// release tag and optional "+metadata" (ignored when comparing).
class Version {
public:
    Version();

    static std::optional<Version> parse(std::string_view text);

    // The text the version was parsed from.
    const std::string& to_string() const { return original_; }
    bool is_prerelease() const { return !release_label_.empty(); }
    const std::string& release_label() const { return release_label_; }

    int compare(const Version& other) const;
    bool operator==(const Version& other) const { return compare(other) == 0; }
    std::strong_ordering operator<=>(const Version& other) const;

private:
    std::vector<unsigned long> numbers_;
    std::string release_label_;
    std::string original_;
};

// Interval constraint over versions. An absent bound is unbounded on that side.
struct VersionRange {
    std::optional<Version> min_version;
    bool min_inclusive = false;
    std::optional<Version> max_version;
    bool max_inclusive = false;

    // NuGet interval notation: "1.0" (>= 1.0), "[1.0]", "[1.0,2.0)", "(,2.0]", "(1.0,)".
    // An empty string is the unbounded range.
    static std::optional<VersionRange> parse(std::string_view text);

    bool satisfies(const Version& version) const;
    std::string to_string() const;
};
