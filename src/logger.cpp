#include "logger.hpp"
#include "time_utils.hpp"
#include <zlib.h>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace argpars {

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::mutex g_log_mtx;
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    std::string prev_path = g_log_path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    std::string target = path;
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        target = prev_path;
        if (!target.empty()) {
            g_log_ofs.clear();
            g_log_ofs.open(target, std::ios::app);
        }
    }
    g_log_path = target;
    g_min_level.store(level);
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open())
        g_log_ofs.flush();
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            ok = false;
            break;
        }
    }
    if (gzclose(out) != Z_OK)
        ok = false;
    if (!ok) {
        std::error_code ec;
        fs::remove(dst, ec);
    }
    return ok;
}

static std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

static const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

static std::string format_line(LogLevel level, const std::string& msg,
                               const std::map<std::string, std::string>& fields) {
    std::string ts = timestamp();
    std::string line;
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + level_label(level) +
               "\",\"msg\":\"" + json_escape(msg) + "\"";
        for (const auto& [k, v] : fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + ts + "] [" + level_label(level) + "] " + msg;
        for (const auto& [k, v] : fields)
            line += " " + k + "=" + v;
    }
    return line;
}

// Shift name.N to name.N+1, dropping the oldest, then move the active file to name.1.
// Caller holds g_log_mtx and has closed g_log_ofs.
static void rotate_files() {
    std::error_code ec;
    size_t keep = g_max_files.load();
    if (keep == 0)
        return;
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    for (size_t i = keep; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + suffix;
        if (i == keep) {
            fs::remove(src, ec);
        } else {
            fs::path dst = g_log_path + "." + std::to_string(i + 1) + suffix;
            fs::rename(src, dst, ec);
        }
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (g_compress_logs.load()) {
        fs::path gz = first;
        gz += ".gz";
        // Only .N.gz names are shifted, so an uncompressed name.1 would be clobbered later.
        if (!gzip_file(first.string(), gz.string()))
            std::cerr << "Failed to compress log file, discarding: " << first.string()
                      << std::endl;
        fs::remove(first, ec);
    }
}

static void write_log_entry(LogLevel level, const std::string& msg,
                            const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (!g_log_ofs.is_open())
        return;
    g_log_ofs << format_line(level, msg, fields) << '\n';
    if (g_max_size.load() == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (ec || size <= g_max_size.load())
        return;
    g_log_ofs.close();
    rotate_files();
    g_log_ofs.clear();
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

static std::map<std::string, std::string> data_field(const std::string& data) {
    if (data.empty())
        return {};
    return {{"data", data}};
}

void log_debug(const std::string& msg) { write_log_entry(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::string& data) {
    write_log_entry(LogLevel::DEBUG, msg, data_field(data));
}
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::DEBUG, msg, fields);
}

void log_info(const std::string& msg) { write_log_entry(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::string& data) {
    write_log_entry(LogLevel::INFO, msg, data_field(data));
}
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::INFO, msg, fields);
}

void log_warning(const std::string& msg) { write_log_entry(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::string& data) {
    write_log_entry(LogLevel::WARNING, msg, data_field(data));
}
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::WARNING, msg, fields);
}

void log_error(const std::string& msg) { write_log_entry(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::string& data) {
    write_log_entry(LogLevel::ERR, msg, data_field(data));
}
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::ERR, msg, fields);
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string up;
    for (char c : name)
        up += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (up == "DEBUG")
        level = LogLevel::DEBUG;
    else if (up == "INFO")
        level = LogLevel::INFO;
    else if (up == "WARNING" || up == "WARN")
        level = LogLevel::WARNING;
    else if (up == "ERROR" || up == "ERR")
        level = LogLevel::ERR;
    else
        return false;
    return true;
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_log_path.clear();
}

} // namespace argpars
