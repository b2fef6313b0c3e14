#include "HttpServer.hpp"
#include <sstream>
#include <string>
#include <vector>
#include "SessionBridge.hpp"
#include "../utils/JsonUtils.hpp"
#include "../utils/Types.h"

// Constructor
HttpServer_C::HttpServer_C(StateStore_s& stateStoreRef, BufferedMarkerChannel_C& markersRef,
                           QueuedResponseChannel_C& responsesRef, int port)
    : stateStoreRef_(stateStoreRef), markersRef_(markersRef), responsesRef_(responsesRef),
      liveServerRef_(nullptr), port_(port) {
}

// Destructor
HttpServer_C::~HttpServer_C() {
    delete liveServerRef_;
}

// ============= Helpers ============
static inline void set_cors_headers(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

// quotes + backslashes + control chars; spo names and markers are short plain text
static std::string json_escape(const std::string& in) {
    std::ostringstream oss;
    for (char c : in) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << ' ';
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

static bool is_json_request(const httplib::Request& req) {
    auto it = req.headers.find("Content-Type");
    return it != req.headers.end() && it->second.find("application/json") != std::string::npos;
}

// Writes JSON string into httplib:response body with correct CORS header
void HttpServer_C::write_json(httplib::Response& res, std::string_view json_body) const {
    set_cors_headers(res);
    res.set_content(std::string(json_body), "application/json");
    res.status = 200;
}

void HttpServer_C::write_error(httplib::Response& res, int status, std::string_view error) const {
    set_cors_headers(res);
    res.status = status;
    res.set_content("{\"ok\":false,\"error\":\"" + std::string(error) + "\"}", "application/json");
}

// Allow methods/headers letting UI make POST requests
void HttpServer_C::handle_options_and_set(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    set_cors_headers(res);
    res.status = 200;
}

// ============== Handlers ==================

void HttpServer_C::handle_get_state(const httplib::Request& req, httplib::Response& res){
    (void)req;

    // 1) "snapshot" read of what the frame loop last published
    int seq = stateStoreRef_.g_seq.load(std::memory_order_acquire);
    bool running = stateStoreRef_.g_stimulus_running.load(std::memory_order_acquire);
    TrainingType_E training = stateStoreRef_.g_training_type.load(std::memory_order_acquire);
    int train_target = stateStoreRef_.g_train_target.load(std::memory_order_acquire);
    int spo_count = stateStoreRef_.g_spo_count.load(std::memory_order_acquire);
    std::uint64_t ping_count = stateStoreRef_.g_ping_count.load(std::memory_order_acquire);
    std::string last_selected = stateStoreRef_.get_last_selected();

    // 2) build json string manually
    std::ostringstream oss;
    oss << "{"
        << "\"seq\":"                 << seq                                  << ","
        << "\"stimulus_running\":"    << (running ? "true" : "false")         << ","
        << "\"training_type\":\""     << TrainingTypeToString(training)       << "\","
        << "\"train_target\":"        << train_target                         << ","
        << "\"last_selected\":\""     << json_escape(last_selected)           << "\","
        << "\"spo_count\":"           << spo_count                            << ","
        << "\"ping_count\":"          << ping_count
        << "}";

    write_json(res, oss.str());
}

// control requests, queued for the frame loop
void HttpServer_C::handle_post_event(const httplib::Request& req, httplib::Response& res){
    if (!is_json_request(req)) {
        write_error(res, 415, "content_type");
        return;
    }

    ControlRequest_S request;
    std::string error;
    if (!bridge::parse_control_request(req.body, request, error)) {
        write_error(res, 400, error);
        return;
    }

    stateStoreRef_.push_control(request);
    LOG_DBG("HTTP /event: queued event " << static_cast<int>(request.event));
    write_json(res, "{\"ok\":true}");
}

// classifier responses: {"tokens":"ping,2"}
void HttpServer_C::handle_post_responses(const httplib::Request& req, httplib::Response& res){
    if (!is_json_request(req)) {
        write_error(res, 415, "content_type");
        return;
    }
    std::string tokens;
    if (!JSON::extract_json_string(req.body, "tokens", tokens)) {
        JSON::json_extract_fail("post_responses", "tokens");
        write_error(res, 400, "missing_tokens");
        return;
    }
    if (!responsesRef_.push_tokens(tokens)) {
        // nobody is listening yet (no run / training started)
        write_error(res, 409, "not_connected");
        return;
    }
    write_json(res, "{\"ok\":true}");
}

void HttpServer_C::handle_get_markers(const httplib::Request& req, httplib::Response& res){
    (void)req;
    std::vector<BufferedMarkerChannel_C::markerRecord_S> records = markersRef_.snapshot();

    std::ostringstream oss;
    oss << "{\"total\":" << markersRef_.get_total_written() << ",\"markers\":[";
    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& rec = records[i];
        oss << "{\"seq\":" << rec.seq
            << ",\"t_ms\":" << rec.t_ms
            << ",\"text\":\"" << json_escape(rec.text) << "\"}";
        if (i + 1 < records.size()) oss << ",";
    }
    oss << "]}";
    write_json(res, oss.str());
}

// flat overrides on top of the active config; anything missing keeps its current value
void HttpServer_C::handle_post_config(const httplib::Request& req, httplib::Response& res){
    if (!is_json_request(req)) {
        write_error(res, 415, "content_type");
        return;
    }
    if (stateStoreRef_.g_stimulus_running.load(std::memory_order_acquire)
        || stateStoreRef_.g_training_type.load(std::memory_order_acquire) != TrainingType_None) {
        write_error(res, 409, "busy");
        return;
    }

    ControllerConfig_S cfg = stateStoreRef_.get_active_config();
    const int fields = bridge::apply_config_overrides(req.body, cfg);
    if (fields == 0) {
        write_error(res, 400, "no_fields");
        return;
    }
    if (!bridge::is_config_valid(cfg)) {
        write_error(res, 400, "invalid_value");
        return;
    }

    stateStoreRef_.request_config(cfg);
    LOG_ALWAYS("HTTP /config: " << fields << " field(s) queued");
    write_json(res, "{\"ok\":true}");
}

// ===================== Lifecycle ==========================
bool HttpServer_C::http_start_server(){
    logger::tlabel = "HTTP Server";
    if (is_running_.load()) return false;

    liveServerRef_ = new httplib::Server();

    // Route bindings
    liveServerRef_->Get("/state",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_get_state(rq, rs); });

    liveServerRef_->Get("/markers",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_get_markers(rq, rs); });

    liveServerRef_->Post("/event",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_post_event(rq, rs); });

    liveServerRef_->Post("/responses",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_post_responses(rq, rs); });

    liveServerRef_->Post("/config",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_post_config(rq, rs); });

    // CORS preflight for POSTs
    for (const char* path : {"/event", "/responses", "/config"}) {
        liveServerRef_->Options(path,
            [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_options_and_set(rq, rs); });
    }

    LOG_ALWAYS("HTTP Server successfully opened");
    return true;
}

bool HttpServer_C::http_listen_for_poll_requests(){
   logger::tlabel = "HTTP Server";
   if(liveServerRef_ == nullptr) {
    LOG_ERR("HTTP server not initialized; cannot start listening");
    return false;
   }
   is_running_.store(true, std::memory_order_release);
   LOG_ALWAYS("HTTP listening on 127.0.0.1: " << port_);

   // blocks until http_close_server()
   bool ok = liveServerRef_->listen("127.0.0.1", port_);
   is_running_.store(false, std::memory_order_release);

   if(!ok){
    LOG_ERR("HTTP listen failed on port " << port_);
   } else {
    LOG_ALWAYS("HTTP listen stopped successfully");
   }
   return ok;
}

bool HttpServer_C::http_close_server(){
    if (!liveServerRef_) return false;
    liveServerRef_->stop(); // breaks .listen()
    LOG_ALWAYS("HTTP Server successfully closed");
    return true;
}
