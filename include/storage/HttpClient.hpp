#pragma once

#include "storage/Client.hpp"
#include "config/Config.hpp"

#include <optional>
#include <string>

namespace zs::util { struct HttpResponse; }

namespace zs::storage {

// Client for the zone's HTTP storage API. Every call is a single blocking request.
class HttpClient final : public Client {
public:
    explicit HttpClient(config::StorageConfig cfg);

    // #########################################################################
    // ############################ OBJECT OPS #################################
    // #########################################################################

    std::vector<model::Object> list(const std::string& dirKey) override;

    void upload(const std::string& key,
                const std::filesystem::path& source,
                const std::optional<std::string>& checksum,
                const ProgressFn& progress) override;

    void download(const std::string& key,
                  const std::filesystem::path& destination,
                  const ProgressFn& progress) override;

    void remove(const std::string& key) override;

    // #########################################################################
    // ############################## HELPERS ##################################
    // #########################################################################

    [[nodiscard]] const std::string& baseUrl() const { return baseUrl_; }
    [[nodiscard]] std::string urlFor(const std::string& key) const;

    // "https://storage.bunnycdn.com/" for an empty or "de" region.
    [[nodiscard]] static std::string baseUrlFor(const config::StorageConfig& cfg);

    // Throws the StorageError matching a failed response; returns for 2xx.
    static void raiseForStatus(const util::HttpResponse& resp,
                               const std::string& zone,
                               const std::string& key,
                               const std::optional<std::string>& checksum = std::nullopt);

private:
    config::StorageConfig cfg_;
    std::string baseUrl_;

    void requireInZone(const std::string& key) const;
};

}
