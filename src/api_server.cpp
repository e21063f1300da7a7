#include "../include/api_server.hpp"
#include "../include/api_router.hpp"
#include "../include/logger.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstring>

extern "C" {
#include <microhttpd.h>
}

#if MHD_VERSION >= 0x00097002
typedef enum MHD_Result MhdResult;
#else
typedef int MhdResult;
#endif

namespace {

MhdResult collectQuery(void* cls, enum MHD_ValueKind, const char* key, const char* value) {
    QueryParams* params = static_cast<QueryParams*>(cls);
    if (key) (*params)[key] = value ? value : "";
    return MHD_YES;
}

MhdResult handleRequest(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                        const char*, const char*, size_t* upload_data_size, void** con_cls) {
    // First call per request only announces the headers
    static int marker;
    if (*con_cls != &marker) {
        *con_cls = &marker;
        return MHD_YES;
    }
    // Request bodies are not used by any route
    if (*upload_data_size != 0) {
        *upload_data_size = 0;
        return MHD_YES;
    }

    QueryParams query;
    MHD_get_connection_values(connection, MHD_GET_ARGUMENT_KIND, collectQuery, &query);

    ApiRouter* router = static_cast<ApiServer*>(cls)->router();
    ApiResponse response = router->handle(method, url, query);
    Logger::debug("[Api] %s %s -> %d", method, url, response.status_code);

    struct MHD_Response* mhd_response = MHD_create_response_from_buffer(
        response.body.size(), (void*)response.body.data(), MHD_RESPMEM_MUST_COPY);
    if (!mhd_response) return MHD_NO;
    MHD_add_response_header(mhd_response, "Content-Type", "application/json");
    MhdResult ret = MHD_queue_response(connection, (unsigned int)response.status_code, mhd_response);
    MHD_destroy_response(mhd_response);
    return ret;
}

} // namespace

ApiServer::ApiServer(ApiRouter* router, const std::string& host, uint16_t port)
    : router_(router), host_(host), port_(port) {}

ApiServer::~ApiServer() { end(); }

bool ApiServer::begin() {
    if (daemon_) return true;

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        Logger::error("[Api] Invalid listen address %s", host_.c_str());
        return false;
    }

    daemon_ = MHD_start_daemon(MHD_USE_INTERNAL_POLLING_THREAD, port_, nullptr, nullptr,
                               &handleRequest, this,
                               MHD_OPTION_SOCK_ADDR, (struct sockaddr*)&addr,
                               MHD_OPTION_END);
    if (!daemon_) {
        Logger::error("[Api] Failed to listen on %s:%u", host_.c_str(), (unsigned)port_);
        return false;
    }
    Logger::info("[Api] Listening on %s:%u", host_.c_str(), (unsigned)port_);
    return true;
}

void ApiServer::end() {
    if (daemon_) {
        MHD_stop_daemon(daemon_);
        daemon_ = nullptr;
        Logger::info("[Api] Stopped");
    }
}
