#include <web_tiles/platform/library_info.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <curl/curl.h>

namespace web_tiles {

namespace {

bool HasProtocol(const curl_version_info_data* info, const std::string& protocol) {
    for (const char* const* it = info->protocols; it != nullptr && *it != nullptr; ++it) {
        if (protocol == *it) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

std::string LibraryInfo::GetVersion() {
    return "0.1.0";
}

std::string LibraryInfo::GetBuildInfo() {
    std::ostringstream oss;
    oss << "Web Tiles " << GetVersion() << " - Built on " << __DATE__ << " " << __TIME__
        << " with libcurl " << LIBCURL_VERSION;
    return oss.str();
}

bool LibraryInfo::CheckSystemRequirements() {
    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    if (!info) {
        spdlog::error("Could not get libcurl version info");
        return false;
    }

    spdlog::info("libcurl version: {}", info->version);

    if (!HasProtocol(info, "http")) {
        spdlog::error("libcurl was built without HTTP support");
        return false;
    }
    if (!HasProtocol(info, "https")) {
        spdlog::warn("libcurl was built without HTTPS support");
        return false;
    }

    spdlog::info("System requirements check passed");
    return true;
}

} // namespace web_tiles
