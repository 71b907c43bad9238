#include <workon/branch_name.hpp>
#include <cctype>

namespace workon {

static WorkonError invalid(const std::string& raw, const std::string& rule) {
    return WorkonError{WorkonError::InvalidArg,
        "invalid branch name '" + raw + "': " + rule};
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Result<BranchName> BranchName::parse(const std::string& raw) {
    if (raw.empty()) {
        return WorkonError{WorkonError::InvalidArg, "empty branch name"};
    }
    if (raw == "@") {
        return invalid(raw, "'@' alone is not a valid name");
    }
    if (raw[0] == '-') {
        return invalid(raw, "must not start with '-'");
    }
    if (raw.find("..") != std::string::npos) {
        return invalid(raw, "must not contain '..'");
    }
    if (raw.find("@{") != std::string::npos) {
        return invalid(raw, "must not contain '@{'");
    }
    if (raw.back() == '.') {
        return invalid(raw, "must not end with '.'");
    }

    for (char c : raw) {
        auto uc = static_cast<unsigned char>(c);
        if (std::iscntrl(uc) || c == ' ' || c == '~' || c == '^' || c == ':' ||
            c == '?' || c == '*' || c == '[' || c == '\\') {
            return invalid(raw, std::string("character '") + c + "' is not allowed");
        }
    }

    BranchName name;
    name.raw_ = raw;

    size_t start = 0;
    for (;;) {
        size_t slash = raw.find('/', start);
        std::string seg = raw.substr(start, slash == std::string::npos
                                                ? std::string::npos
                                                : slash - start);
        if (seg.empty()) {
            return invalid(raw, "empty path component (leading, trailing or double '/')");
        }
        if (seg[0] == '.') {
            return invalid(raw, "component '" + seg + "' must not start with '.'");
        }
        if (ends_with(seg, ".lock")) {
            return invalid(raw, "component '" + seg + "' must not end with '.lock'");
        }
        name.segments_.push_back(std::move(seg));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }

    return Result<BranchName>::ok(std::move(name));
}

const std::string& BranchName::str() const { return raw_; }
const std::vector<std::string>& BranchName::segments() const { return segments_; }

std::filesystem::path BranchName::relative_path() const {
    std::filesystem::path p;
    for (const auto& seg : segments_) p /= seg;
    return p;
}

bool BranchName::operator==(const BranchName& o) const {
    return raw_ == o.raw_;
}

bool BranchName::operator!=(const BranchName& o) const {
    return !(*this == o);
}

} // namespace workon
