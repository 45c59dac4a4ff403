#include "batchdl/detail/curl_utils.hpp"

#include <stdexcept>

namespace batchdl::detail {

namespace {

class CurlGlobal {
public:
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace

CurlHandle makeCurlHandle() {
    static const CurlGlobal global;
    return CurlHandle{curl_easy_init(), &curl_easy_cleanup};
}

} // namespace batchdl::detail
