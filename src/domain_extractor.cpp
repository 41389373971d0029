#include "domain_extractor.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <string_view>
#include <vector>

namespace epm {

namespace {

std::string to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool is_ip_literal(const std::string& host) {
    if (host.find(':') != std::string::npos) {
        return true;  // IPv6
    }
    return std::all_of(host.begin(), host.end(),
                       [](unsigned char c) { return std::isdigit(c) || c == '.'; });
}

// Offsets where each label of the host begins: "a.b.c" -> {0, 2, 4}
std::vector<size_t> label_offsets(const std::string& host) {
    std::vector<size_t> offsets{0};
    for (size_t pos = host.find('.'); pos != std::string::npos; pos = host.find('.', pos + 1)) {
        offsets.push_back(pos + 1);
    }
    return offsets;
}

} // namespace

DomainExtractor::DomainExtractor(const std::string& suffix_list_path, bool include_private)
    : include_private_(include_private) {
    if (!suffix_list_path.empty()) {
        owned_.reset(psl_load_file(suffix_list_path.c_str()));
        if (!owned_) {
            Logger::warn(Logger::Component::Domain,
                fmt::format("Failed to load public suffix list {}; using libpsl defaults", suffix_list_path));
        }
    }
    if (!owned_) {
        owned_.reset(psl_latest(nullptr));
    }

    psl_ = owned_ ? owned_.get() : psl_builtin();
    if (!psl_) {
        Logger::error(Logger::Component::Domain,
            "No public suffix data available; grouping endpoints by host name");
        return;
    }

    Logger::info(Logger::Component::Domain,
        fmt::format("Public suffix list ready (libpsl {}, {} rules)", psl_get_version(), psl_suffix_count(psl_)));
}

std::expected<std::string, std::string> DomainExtractor::extract(const std::string& url) const {
    auto host = host_of(url);
    if (!host) {
        return std::unexpected(host.error());
    }

    if (is_ip_literal(*host) || host->find('.') == std::string::npos) {
        return *host;
    }

    return registrable_domain(*host).value_or(*host);
}

std::optional<std::string> DomainExtractor::registrable_domain(const std::string& host) const {
    if (!psl_) {
        return std::nullopt;
    }

    const auto offsets = label_offsets(host);

    // Longest candidate first, so the first suffix found is the prevailing rule
    for (size_t i = 0; i < offsets.size(); ++i) {
        const char* candidate = host.c_str() + offsets[i];
        int is_suffix = include_private_
            ? psl_is_public_suffix(psl_, candidate)
            : psl_is_public_suffix2(psl_, candidate, PSL_TYPE_ICANN);
        if (is_suffix) {
            if (i == 0) {
                return std::nullopt;
            }
            return host.substr(offsets[i - 1]);
        }
    }

    // Implicit "*" rule: the last label is the suffix
    if (offsets.size() < 2) {
        return std::nullopt;
    }
    return host.substr(offsets[offsets.size() - 2]);
}

bool DomainExtractor::has_suffix_data() const {
    return psl_ != nullptr;
}

std::expected<std::string, std::string> DomainExtractor::host_of(const std::string& url) {
    std::string_view rest(url);

    auto first = rest.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return std::unexpected("Empty URL");
    }
    rest.remove_prefix(first);
    rest = rest.substr(0, rest.find_last_not_of(" \t\r\n") + 1);

    auto scheme_end = rest.find("://");
    if (scheme_end != std::string_view::npos && scheme_end < rest.find_first_of("/?#")) {
        rest.remove_prefix(scheme_end + 3);
    } else if (rest.starts_with("//")) {
        rest.remove_prefix(2);
    }

    std::string_view authority = rest.substr(0, rest.find_first_of("/?#"));

    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host;
    if (authority.starts_with("[")) {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::unexpected("Unterminated IPv6 address in URL: " + url);
        }
        host = authority.substr(1, close - 1);
    } else {
        host = authority.substr(0, authority.find(':'));
    }

    while (host.ends_with(".")) {
        host.remove_suffix(1);
    }
    if (host.empty()) {
        return std::unexpected("No host in URL: " + url);
    }

    return to_lower(host);
}

} // namespace epm
