#include "storage/HttpClient.hpp"
#include "storage/errors.hpp"
#include "util/curlWrappers.hpp"
#include "util/objectKey.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <fstream>
#include <sstream>

using namespace zs;
using namespace zs::storage;
using namespace zs::util;

namespace {

struct DownloadSink {
    std::ofstream* out = nullptr;
    CURL* handle = nullptr;
    std::string errorBody;
};

// Error responses are kept out of the destination file.
size_t writeToSink(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* sink = static_cast<DownloadSink*>(userdata);
    long http = 0;
    curl_easy_getinfo(sink->handle, CURLINFO_RESPONSE_CODE, &http);
    if (http / 100 != 2) {
        sink->errorBody.append(ptr, size * nmemb);
        return size * nmemb;
    }
    sink->out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return *sink->out ? size * nmemb : 0;
}

size_t readFromStream(char* buf, const size_t size, const size_t nmemb, void* userdata) {
    auto* in = static_cast<std::ifstream*>(userdata);
    in->read(buf, static_cast<std::streamsize>(size * nmemb));
    return static_cast<size_t>(in->gcount());
}

struct ProgressHook {
    const ProgressFn* fn = nullptr;
    bool upload = false;
};

int onTransferInfo(void* clientp, curl_off_t, const curl_off_t dlnow, curl_off_t, const curl_off_t ulnow) {
    const auto* hook = static_cast<ProgressHook*>(clientp);
    if (hook->fn && *hook->fn) (*hook->fn)(static_cast<uintmax_t>(hook->upload ? ulnow : dlnow));
    return 0;
}

void installProgress(CURL* h, ProgressHook& hook) {
    if (!hook.fn || !*hook.fn) return;
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, onTransferInfo);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &hook);
}

std::string escapeSegments(const std::string& key) {
    CurlEasy h;
    std::string out;
    std::istringstream in(key);
    std::string segment;
    bool first = true;
    while (std::getline(in, segment, '/')) {
        if (!first) out += '/';
        first = false;
        if (segment.empty()) continue;
        char* esc = curl_easy_escape(h, segment.c_str(), static_cast<int>(segment.size()));
        if (!esc) throw std::runtime_error("curl_easy_escape failed for " + key);
        out += esc;
        curl_free(esc);
    }
    if (!key.empty() && key.back() == '/') out += '/';
    return out;
}

}

// ##########################################################################
// ############################### SETUP ####################################
// ##########################################################################

HttpClient::HttpClient(config::StorageConfig cfg)
    : cfg_(std::move(cfg)), baseUrl_(baseUrlFor(cfg_)) {
    if (cfg_.zone.empty()) throw std::invalid_argument("HttpClient requires a storage zone");
    ensureCurlGlobalInit();
}

std::string HttpClient::baseUrlFor(const config::StorageConfig& cfg) {
    if (!cfg.endpoint.empty()) {
        auto url = cfg.endpoint;
        if (url.back() != '/') url += '/';
        return url;
    }
    if (cfg.region.empty() || iequals(cfg.region, "de")) return "https://storage.bunnycdn.com/";
    return fmt::format("https://{}.storage.bunnycdn.com/", cfg.region);
}

std::string HttpClient::urlFor(const std::string& key) const {
    return baseUrl_ + escapeSegments(key);
}

void HttpClient::requireInZone(const std::string& key) const {
    if (!key.starts_with(cfg_.zone + "/"))
        throw StorageError(ErrorKind::Unknown, key,
                           fmt::format("Object key '{}' is outside storage zone '{}'", key, cfg_.zone));
}

void HttpClient::raiseForStatus(const HttpResponse& resp,
                                const std::string& zone,
                                const std::string& key,
                                const std::optional<std::string>& checksum) {
    if (resp.curl != CURLE_OK)
        throw StorageError(ErrorKind::Unknown, key,
                           fmt::format("Transport error for {}: {}", key, curl_easy_strerror(resp.curl)));

    if (resp.http / 100 == 2) return;

    switch (resp.http) {
    case 404: throw NotFoundError(key);
    case 401: throw AuthFailureError(zone);
    case 400:
        if (checksum) throw ChecksumMismatchError(key, *checksum);
        break;
    default: break;
    }

    throw StorageError(ErrorKind::Unknown, key,
                       fmt::format("Unexpected HTTP {} for {}: {}", resp.http, key, resp.body));
}

// ##########################################################################
// ############################# OBJECT OPS #################################
// ##########################################################################

std::vector<zs::storage::model::Object> HttpClient::list(const std::string& dirKey) {
    requireInZone(dirKey);
    const auto key = normalizeKey(dirKey, true);
    const auto url = urlFor(key);

    SList hdrs;
    hdrs.add("AccessKey: " + cfg_.access_key);
    hdrs.add("Accept: application/json");

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    });

    try {
        raiseForStatus(resp, cfg_.zone, key);
    } catch (const StorageError& e) {
        log::Registry::cloud()->warn("[HttpClient] LIST {} failed: {}", key, e.what());
        throw;
    }

    try {
        return model::parseListing(resp.body);
    } catch (const std::exception& e) {
        throw StorageError(ErrorKind::Unknown, key, fmt::format("Malformed listing for {}: {}", key, e.what()));
    }
}

void HttpClient::upload(const std::string& key,
                        const std::filesystem::path& source,
                        const std::optional<std::string>& checksum,
                        const ProgressFn& progress) {
    requireInZone(key);

    std::error_code ec;
    const auto size = std::filesystem::file_size(source, ec);
    if (ec) throw LocalIOError(key, fmt::format("Cannot stat {}: {}", source.string(), ec.message()));

    std::ifstream fin(source, std::ios::binary);
    if (!fin) throw LocalIOError(key, "Cannot open " + source.string() + " for reading");

    const auto url = urlFor(key);

    SList hdrs;
    hdrs.add("AccessKey: " + cfg_.access_key);
    hdrs.add("Content-Type: application/octet-stream");
    if (checksum) hdrs.add("Checksum: " + *checksum);

    ProgressHook hook{&progress, true};

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_READDATA, &fin);
        curl_easy_setopt(h, CURLOPT_READFUNCTION, readFromStream);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
        installProgress(h, hook);
    });

    if (fin.bad()) throw LocalIOError(key, "Read error on " + source.string());

    try {
        raiseForStatus(resp, cfg_.zone, key, checksum);
    } catch (const StorageError& e) {
        log::Registry::cloud()->error("[HttpClient] PUT {} failed: {}", key, e.what());
        throw;
    }

    if (progress) progress(size);
    log::Registry::audit()->info("PUT {} bytes={} checksum={}", key, size, checksum.value_or("-"));
}

void HttpClient::download(const std::string& key,
                          const std::filesystem::path& destination,
                          const ProgressFn& progress) {
    requireInZone(key);

    std::error_code ec;
    if (destination.has_parent_path()) std::filesystem::create_directories(destination.parent_path(), ec);
    if (ec) throw LocalIOError(key, fmt::format("Cannot create {}: {}", destination.parent_path().string(), ec.message()));

    std::ofstream fout(destination, std::ios::binary | std::ios::trunc);
    if (!fout) throw LocalIOError(key, "Cannot open " + destination.string() + " for writing");

    const auto url = urlFor(key);

    SList hdrs;
    hdrs.add("AccessKey: " + cfg_.access_key);

    ProgressHook hook{&progress, false};
    DownloadSink sink{&fout, nullptr, {}};

    auto resp = performCurl([&](CURL* h) {
        sink.handle = h;
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToSink);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
        installProgress(h, hook);
    });
    resp.body = std::move(sink.errorBody);
    fout.close();

    if (resp.curl == CURLE_WRITE_ERROR || fout.fail()) {
        std::filesystem::remove(destination, ec);
        throw LocalIOError(key, "Write error on " + destination.string());
    }

    try {
        raiseForStatus(resp, cfg_.zone, key);
    } catch (const StorageError& e) {
        std::filesystem::remove(destination, ec);
        log::Registry::cloud()->error("[HttpClient] GET {} failed: {}", key, e.what());
        throw;
    }

    std::error_code sizeEc;
    const auto written = std::filesystem::file_size(destination, sizeEc);
    if (progress && !sizeEc) progress(written);
    log::Registry::audit()->info("GET {} -> {}", key, destination.string());
}

void HttpClient::remove(const std::string& key) {
    requireInZone(key);
    const auto url = urlFor(key);

    SList hdrs;
    hdrs.add("AccessKey: " + cfg_.access_key);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    });

    if (resp.curl == CURLE_OK && resp.http == 404) {
        log::Registry::cloud()->debug("[HttpClient] DELETE {}: already gone", key);
        return;
    }

    try {
        raiseForStatus(resp, cfg_.zone, key);
    } catch (const StorageError& e) {
        log::Registry::cloud()->error("[HttpClient] DELETE {} failed: {}", key, e.what());
        throw;
    }

    log::Registry::audit()->info("DELETE {}", key);
}
