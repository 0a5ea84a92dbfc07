/**
 * @file handlers.cpp
 * @brief IPC request handler implementations
 */

#include "wardend/ipc/handlers.h"
#include "wardend/core/daemon.h"
#include "wardend/config.h"
#include "wardend/errors.h"
#include "wardend/logger.h"
#include "wardend/watcher/arbiter.h"
#include <cstdint>

namespace wardend {

void Handlers::register_all(IPCServer& server, Arbiter& arbiter) {
    Arbiter* arb = &arbiter;
    
    server.register_handler(Methods::PING, [](const Request& req) {
        return handle_ping(req);
    });
    server.register_handler(Methods::VERSION, [](const Request& req) {
        return handle_version(req);
    });
    
    // Status (never takes the command gate)
    server.register_handler(Methods::STATUS, [arb](const Request& req) {
        return handle_status(req, *arb);
    });
    server.register_handler(Methods::LIST, [arb](const Request& req) {
        return handle_list(req, *arb);
    });
    server.register_handler(Methods::WATCHER_STATUS, [arb](const Request& req) {
        return handle_watcher_status(req, *arb);
    });
    
    // Exclusive commands
    server.register_handler(Methods::WATCHER_START, [arb](const Request& req) {
        return handle_watcher_start(req, *arb);
    });
    server.register_handler(Methods::WATCHER_STOP, [arb](const Request& req) {
        return handle_watcher_stop(req, *arb);
    });
    server.register_handler(Methods::WATCHER_RESTART, [arb](const Request& req) {
        return handle_watcher_restart(req, *arb);
    });
    server.register_handler(Methods::WATCHER_INCR, [arb](const Request& req) {
        return handle_watcher_incr(req, *arb);
    });
    server.register_handler(Methods::WATCHER_DECR, [arb](const Request& req) {
        return handle_watcher_decr(req, *arb);
    });
    server.register_handler(Methods::START, [arb](const Request& req) {
        return handle_start(req, *arb);
    });
    server.register_handler(Methods::STOP, [arb](const Request& req) {
        return handle_stop(req, *arb);
    });
    server.register_handler(Methods::RELOAD, [](const Request& req) {
        return handle_reload(req);
    });
    
    server.register_handler(Methods::CONFIG_GET, [](const Request& req) {
        return handle_config_get(req);
    });
    server.register_handler(Methods::SHUTDOWN, [](const Request& req) {
        return handle_shutdown(req);
    });
    
    // Anyone who can reach the socket may query, only root and our own user may act
    for (const char* method : {Methods::PING, Methods::VERSION, Methods::STATUS, Methods::LIST,
                               Methods::WATCHER_STATUS, Methods::CONFIG_GET}) {
        server.mark_read_only(method);
    }
    
    LOG_INFO("Handlers", "Registered " + std::to_string(server.handler_count()) + " IPC handlers");
}

Response Handlers::handle_ping(const Request& /*req*/) {
    return Response::ok({{"pong", true}});
}

Response Handlers::handle_version(const Request& /*req*/) {
    return Response::ok({
        {"version", VERSION},
        {"name", NAME}
    });
}

Response Handlers::handle_status(const Request& /*req*/, Arbiter& arbiter) {
    json watchers = json::array();
    for (const auto& status : arbiter.statuses()) {
        watchers.push_back(status->to_json());
    }
    
    CommandGate& gate = arbiter.gate();
    return Response::ok({
        {"uptime_seconds", Daemon::instance().uptime().count()},
        {"healthy", arbiter.is_healthy()},
        {"gate", {
            {"active", gate.active_command()},
            {"acquisitions", gate.acquisitions()},
            {"busy_rejections", gate.busy_rejections()}
        }},
        {"watchers", watchers}
    });
}

Response Handlers::handle_list(const Request& /*req*/, Arbiter& arbiter) {
    return Response::ok({{"watchers", arbiter.watcher_names()}});
}

Response Handlers::handle_watcher_status(const Request& req, Arbiter& arbiter) {
    return Response::ok(arbiter.watcher_status(watcher_name(req))->to_json());
}

Response Handlers::handle_watcher_start(const Request& req, Arbiter& arbiter) {
    std::string name = watcher_name(req);
    arbiter.start_watcher(name);
    return Response::ok(arbiter.watcher_status(name)->to_json());
}

Response Handlers::handle_watcher_stop(const Request& req, Arbiter& arbiter) {
    std::string name = watcher_name(req);
    arbiter.stop_watcher(name);
    return Response::ok(arbiter.watcher_status(name)->to_json());
}

Response Handlers::handle_watcher_restart(const Request& req, Arbiter& arbiter) {
    std::string name = watcher_name(req);
    arbiter.restart_watcher(name);
    return Response::ok(arbiter.watcher_status(name)->to_json());
}

Response Handlers::handle_watcher_incr(const Request& req, Arbiter& arbiter) {
    std::string name = watcher_name(req);
    int desired = arbiter.incr_watcher(name, count_param(req));
    return Response::ok({{"name", name}, {"numprocesses", desired}});
}

Response Handlers::handle_watcher_decr(const Request& req, Arbiter& arbiter) {
    std::string name = watcher_name(req);
    int desired = arbiter.decr_watcher(name, count_param(req));
    return Response::ok({{"name", name}, {"numprocesses", desired}});
}

Response Handlers::handle_start(const Request& /*req*/, Arbiter& arbiter) {
    arbiter.start_all();
    return Response::ok({{"started", arbiter.watcher_names()}});
}

Response Handlers::handle_stop(const Request& /*req*/, Arbiter& arbiter) {
    arbiter.stop_all();
    return Response::ok({{"stopped", arbiter.watcher_names()}});
}

Response Handlers::handle_reload(const Request& /*req*/) {
    if (Daemon::instance().reload_config()) {
        return Response::ok({{"reloaded", true}});
    }
    return Response::err("Failed to reload configuration", ErrorCodes::CONFIG_ERROR);
}

Response Handlers::handle_config_get(const Request& /*req*/) {
    const auto config = ConfigManager::instance().get();
    
    json watchers = json::array();
    for (const auto& watcher : config.watchers) {
        watchers.push_back({
            {"name", watcher.name},
            {"cmd", watcher.cmd},
            {"numprocesses", watcher.numprocesses},
            {"priority", watcher.priority},
            {"autostart", watcher.autostart},
            {"on_demand", watcher.on_demand}
        });
    }
    
    json result = {
        {"socket_path", config.socket_path},
        {"socket_backlog", config.socket_backlog},
        {"socket_timeout_ms", config.socket_timeout_ms},
        {"max_requests_per_sec", config.max_requests_per_sec},
        {"check_interval_ms", config.check_interval_ms},
        {"command_timeout_ms", config.command_timeout_ms},
        {"log_level", config.log_level},
        {"signals", config.signals},
        {"watchers", watchers}
    };
    
    return Response::ok(result);
}

Response Handlers::handle_shutdown(const Request& /*req*/) {
    LOG_INFO("Handlers", "Shutdown requested via IPC");
    Daemon::instance().request_shutdown();
    return Response::ok({{"shutdown", "initiated"}});
}

std::string Handlers::watcher_name(const Request& req) {
    return req.params.at("name").get<std::string>();
}

int Handlers::count_param(const Request& req) {
    // Read wide so an out-of-range count is refused instead of truncated
    int64_t count = req.params.value("count", static_cast<int64_t>(1));
    if (count < 1 || count > MAX_NUMPROCESSES) {
        throw WardenError("count must be between 1 and " + std::to_string(MAX_NUMPROCESSES));
    }
    return static_cast<int>(count);
}

} // namespace wardend
