#include "version.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace {

constexpr size_t MAX_VERSION_COMPONENTS = 4;

bool is_numeric(std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool is_label_identifier(std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](unsigned char c) { return std::isalnum(c) != 0 || c == '-'; });
}

// Numeric identifiers compare by value, compared here without conversion so
// that arbitrarily long digit runs cannot overflow.
int compare_numeric(std::string_view a, std::string_view b) {
    while (a.size() > 1 && a.front() == '0') a.remove_prefix(1);
    while (b.size() > 1 && b.front() == '0') b.remove_prefix(1);
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    const int c = a.compare(b);
    return (c < 0) ? -1 : (c > 0 ? 1 : 0);
}

int compare_labels(const std::string& l1, const std::string& l2) {
    // A release sorts above any prerelease of the same numbers: 1.0.0 > 1.0.0-alpha
    if (l1.empty() && l2.empty()) return 0;
    if (l1.empty()) return 1;
    if (l2.empty()) return -1;

    const auto p1 = split(l1, '.');
    const auto p2 = split(l2, '.');
    const size_t len = std::max(p1.size(), p2.size());
    for (size_t i = 0; i < len; ++i) {
        if (i >= p1.size()) return -1; // 1.0.0-alpha < 1.0.0-alpha.1
        if (i >= p2.size()) return 1;

        const bool is_num1 = is_numeric(p1[i]);
        const bool is_num2 = is_numeric(p2[i]);
        if (is_num1 && is_num2) {
            if (int c = compare_numeric(p1[i], p2[i]); c != 0) return c;
        } else {
            if (is_num1 && !is_num2) return -1;
            if (!is_num1 && is_num2) return 1;
            const std::string a = to_lower(p1[i]);
            const std::string b = to_lower(p2[i]);
            if (a < b) return -1;
            if (a > b) return 1;
        }
    }
    return 0;
}

} // anonymous namespace

Version::Version() : numbers_{0, 0, 0}, original_("0.0.0") {}

std::optional<Version> Version::parse(std::string_view text) {
    const std::string trimmed = trim(text);
    std::string_view sv = trimmed;
    if (sv.empty()) return std::nullopt;

    if (const auto plus = sv.find('+'); plus != std::string_view::npos) {
        if (plus + 1 == sv.size()) return std::nullopt;
        sv = sv.substr(0, plus);
    }

    Version v;
    v.numbers_.clear();
    v.original_ = trimmed;

    std::string_view core = sv;
    if (const auto hyphen = sv.find('-'); hyphen != std::string_view::npos) {
        core = sv.substr(0, hyphen);
        const std::string_view label = sv.substr(hyphen + 1);
        for (const auto part : split(label, '.')) {
            if (!is_label_identifier(part)) return std::nullopt;
        }
        v.release_label_ = std::string(label);
    }

    const auto parts = split(core, '.');
    if (parts.empty() || parts.size() > MAX_VERSION_COMPONENTS) return std::nullopt;
    for (const auto part : parts) {
        if (!is_numeric(part)) return std::nullopt;
        unsigned long n = 0;
        const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), n);
        if (ec != std::errc{} || ptr != part.data() + part.size()) return std::nullopt;
        v.numbers_.push_back(n);
    }
    return v;
}

int Version::compare(const Version& other) const {
    for (size_t i = 0; i < MAX_VERSION_COMPONENTS; ++i) {
        const unsigned long n1 = i < numbers_.size() ? numbers_[i] : 0;
        const unsigned long n2 = i < other.numbers_.size() ? other.numbers_[i] : 0;
        if (n1 < n2) return -1;
        if (n1 > n2) return 1;
    }
    return compare_labels(release_label_, other.release_label_);
}

std::strong_ordering Version::operator<=>(const Version& other) const {
    const int c = compare(other);
    if (c < 0) return std::strong_ordering::less;
    if (c > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

std::optional<VersionRange> VersionRange::parse(std::string_view text) {
    const std::string trimmed = trim(text);
    std::string_view sv = trimmed;
    VersionRange range;
    if (sv.empty()) return range;

    const char open = sv.front();
    if (open != '[' && open != '(') {
        auto v = Version::parse(sv);
        if (!v) return std::nullopt;
        range.min_version = std::move(v);
        range.min_inclusive = true;
        return range;
    }

    const char close = sv.back();
    if (sv.size() < 3 || (close != ']' && close != ')')) return std::nullopt;
    range.min_inclusive = (open == '[');
    range.max_inclusive = (close == ']');

    const std::string_view inner = sv.substr(1, sv.size() - 2);
    const auto parts = split(inner, ',');
    if (parts.size() == 1) {
        // "[1.0]" pins exactly one version
        if (!range.min_inclusive || !range.max_inclusive) return std::nullopt;
        auto v = Version::parse(parts[0]);
        if (!v) return std::nullopt;
        range.min_version = *v;
        range.max_version = std::move(v);
        return range;
    }
    if (parts.size() != 2) return std::nullopt;

    const std::string min_text = trim(parts[0]);
    const std::string max_text = trim(parts[1]);
    if (min_text.empty() && max_text.empty()) return std::nullopt;
    if (!min_text.empty()) {
        range.min_version = Version::parse(min_text);
        if (!range.min_version) return std::nullopt;
    }
    if (!max_text.empty()) {
        range.max_version = Version::parse(max_text);
        if (!range.max_version) return std::nullopt;
    }
    if (range.min_version && range.max_version) {
        if (*range.min_version > *range.max_version) return std::nullopt;
        if (*range.min_version == *range.max_version && !(range.min_inclusive && range.max_inclusive)) return std::nullopt;
    }
    return range;
}

bool VersionRange::satisfies(const Version& version) const {
    if (min_version) {
        if (min_inclusive ? version < *min_version : version <= *min_version) return false;
    }
    if (max_version) {
        if (max_inclusive ? version > *max_version : version >= *max_version) return false;
    }
    return true;
}

std::string VersionRange::to_string() const {
    if (!min_version && !max_version) return "(,)";
    if (min_version && !max_version && min_inclusive) return min_version->to_string();
    if (min_version && max_version && *min_version == *max_version) return "[" + min_version->to_string() + "]";

    std::string out(1, min_inclusive ? '[' : '(');
    if (min_version) out += min_version->to_string();
    out += ',';
    if (max_version) out += max_version->to_string();
    out += max_inclusive ? ']' : ')';
    return out;
}
