/*
HTTP SERVER : BRIDGE
- starts httplib::Server on 127.0.0.1 so a page (or curl, or a classifier process) can drive a headless session
- blocks inside listen() loop, hence requires its own thread
- never touches the controller: reads the StateStore snapshot, queues control/config requests for the frame loop,
  hands response tokens to the QueuedResponseChannel_C (thread safe) and reads marker history from the BufferedMarkerChannel_C
--> GET  /state      session snapshot (JSON)
--> POST /event      {"action": "...", "training": "...", "index": N}
--> POST /responses  {"tokens": "ping,2"}
--> GET  /markers    recent markers, oldest first
--> POST /config     flat config overrides, applied while idle
*/
#pragma once
#include <httplib.h>
#include <atomic>
#include <string_view>
#include "../comms/BufferedMarkerChannel.hpp"
#include "../comms/QueuedResponseChannel.hpp"
#include "../shared/StateStore.hpp"
#include "../utils/Logger.hpp"

/*
JSON schema for GET /state:

{
  "seq": int,                // bumps whenever the frame loop publishes a change
  "stimulus_running": bool,
  "training_type": string,   // "None" | "Automated" | "Iterative" | "User"
  "train_target": int,       // 99 when no target is active
  "last_selected": string,   // "" until something is selected in the current run
  "spo_count": int,
  "ping_count": int
}
*/

class HttpServer_C {
public: // API
    HttpServer_C(StateStore_s& stateStoreRef, BufferedMarkerChannel_C& markersRef,
                 QueuedResponseChannel_C& responsesRef, int port=7777);
    ~HttpServer_C();
    bool http_start_server(); // constructs httplib::server
    bool http_listen_for_poll_requests(); // blocking .listen()
    bool http_close_server(); // calls server's stop hook so .listen() returns
    bool get_is_running() { return is_running_; };
private:
    StateStore_s& stateStoreRef_;
    BufferedMarkerChannel_C& markersRef_;
    QueuedResponseChannel_C& responsesRef_;
    httplib::Server* liveServerRef_; // live httplib::server
    int port_;
    std::atomic<bool> is_running_ = false;
    // Handlers
    void handle_get_state(const httplib::Request& req, httplib::Response& res);
    void handle_post_event(const httplib::Request& req, httplib::Response& res);
    void handle_post_responses(const httplib::Request& req, httplib::Response& res);
    void handle_get_markers(const httplib::Request& req, httplib::Response& res);
    void handle_post_config(const httplib::Request& req, httplib::Response& res);
    void handle_options_and_set(const httplib::Request& req, httplib::Response& res); // CORS preflight
    void write_json(httplib::Response& res, std::string_view json_body) const;
    void write_error(httplib::Response& res, int status, std::string_view error) const;
}; // HttpServer_C
