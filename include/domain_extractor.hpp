#pragma once

#include <libpsl.h>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace epm {

// Registrable-domain lookup backed by libpsl and the Mozilla Public Suffix List.
class DomainExtractor {
public:
    // An empty path selects the newest list libpsl knows of (system file or
    // built-in data). A path that cannot be loaded falls back to the same.
    explicit DomainExtractor(const std::string& suffix_list_path = "", bool include_private = false);

    DomainExtractor(const DomainExtractor&) = delete;
    DomainExtractor& operator=(const DomainExtractor&) = delete;

    // https://api.shop.example.co.uk:8080/x -> example.co.uk
    // IP literals, single-label hosts and bare public suffixes map to themselves.
    std::expected<std::string, std::string> extract(const std::string& url) const;

    // Public suffix plus one label, or nullopt when the host is itself a
    // public suffix. Unlisted TLDs fall under the implicit "*" rule.
    std::optional<std::string> registrable_domain(const std::string& host) const;

    bool has_suffix_data() const;

    // Lower-cased host with scheme, userinfo, port, path, query and fragment removed.
    static std::expected<std::string, std::string> host_of(const std::string& url);

private:
    struct PslDeleter {
        void operator()(psl_ctx_t* ctx) const { psl_free(ctx); }
    };

    std::unique_ptr<psl_ctx_t, PslDeleter> owned_;
    const psl_ctx_t* psl_ = nullptr;  // owned_ or libpsl's static built-in context
    bool include_private_;
};

} // namespace epm
