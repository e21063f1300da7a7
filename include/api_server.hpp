#pragma once
#include <stdint.h>
#include <string>

struct MHD_Daemon;
class ApiRouter;

// libmicrohttpd front end for ApiRouter, served from the daemon's own thread.
class ApiServer {
public:
    ApiServer(ApiRouter* router, const std::string& host, uint16_t port);
    ~ApiServer();

    bool begin();
    void end();
    bool isRunning() const { return daemon_ != nullptr; }
    ApiRouter* router() const { return router_; }

private:
    ApiRouter* router_;
    std::string host_;
    uint16_t port_;
    MHD_Daemon* daemon_ = nullptr;
};
