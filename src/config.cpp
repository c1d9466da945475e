#include "canopy/config.hpp"
#include "canopy/types.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace canopy {

    namespace {
        using json = boost::json::value;

        const boost::json::object *section(const boost::json::object &root, const char *name) {
            auto it = root.find(name);
            if (it == root.end())
                return nullptr;
            if (!it->value().is_object())
                throw ConfigError(std::string("canopy::parseConfig(): '") + name + "' is not an object");
            return &it->value().as_object();
        }

        const json *field(const boost::json::object *obj, const char *key) {
            if (!obj)
                return nullptr;
            auto it = obj->find(key);
            return it == obj->end() ? nullptr : &it->value();
        }

        void readString(const boost::json::object *obj, const char *key, std::string &out) {
            if (auto *v = field(obj, key)) {
                if (!v->is_string())
                    throw ConfigError(std::string("canopy::parseConfig(): '") + key + "' must be a string");
                out = std::string(v->as_string());
            }
        }

        void readNumber(const boost::json::object *obj, const char *key, double &out) {
            if (auto *v = field(obj, key)) {
                if (!v->is_number())
                    throw ConfigError(std::string("canopy::parseConfig(): '") + key + "' must be a number");
                out = boost::json::value_to<double>(*v);
            }
        }

        template <typename Int> void readInteger(const boost::json::object *obj, const char *key, Int &out) {
            if (auto *v = field(obj, key)) {
                if (!v->is_int64() && !v->is_uint64())
                    throw ConfigError(std::string("canopy::parseConfig(): '") + key + "' must be an integer");
                const bool fits = v->is_int64()
                                      ? v->get_int64() >= static_cast<std::int64_t>(std::numeric_limits<Int>::min()) &&
                                            v->get_int64() <= static_cast<std::int64_t>(std::numeric_limits<Int>::max())
                                      : v->get_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<Int>::max());
                if (!fits)
                    throw ConfigError(std::string("canopy::parseConfig(): '") + key + "' is out of range");
                out = v->is_int64() ? static_cast<Int>(v->get_int64()) : static_cast<Int>(v->get_uint64());
            }
        }

        void readBool(const boost::json::object *obj, const char *key, bool &out) {
            if (auto *v = field(obj, key)) {
                if (!v->is_bool())
                    throw ConfigError(std::string("canopy::parseConfig(): '") + key + "' must be a boolean");
                out = v->get_bool();
            }
        }
    } // namespace

    Config parseConfig(const std::string &text) {
        boost::json::error_code ec;
        json root = boost::json::parse(text, ec);
        if (ec)
            throw ConfigError("canopy::parseConfig(): failed to parse JSON: " + ec.message());
        if (!root.is_object())
            throw ConfigError("canopy::parseConfig(): top-level value is not an object");

        const auto &obj = root.as_object();
        Config config;

        auto *ingestor = section(obj, "ingestor");
        readString(ingestor, "endpoint", config.ingestor.endpoint);
        readInteger(ingestor, "serverTimeoutSeconds", config.ingestor.serverTimeoutSeconds);
        if (config.ingestor.serverTimeoutSeconds <= 0)
            throw ConfigError("canopy::parseConfig(): 'serverTimeoutSeconds' must be positive");

        auto *scheduler = section(obj, "scheduler");
        std::int64_t quietMs = config.scheduler.quietPeriod.count();
        readInteger(scheduler, "quietPeriodMs", quietMs);
        if (quietMs < 0)
            throw ConfigError("canopy::parseConfig(): 'quietPeriodMs' must not be negative");
        config.scheduler.quietPeriod = std::chrono::milliseconds(quietMs);
        readNumber(scheduler, "minZoom", config.scheduler.minZoom);
        readBool(scheduler, "discardSuperseded", config.scheduler.discardSuperseded);

        auto *proximity = section(obj, "proximity");
        readNumber(proximity, "bufferFt", config.proximity.bufferFt);
        if (config.proximity.bufferFt < 0.0)
            throw ConfigError("canopy::parseConfig(): 'bufferFt' must not be negative");
        readInteger(proximity, "arcSegments", config.proximity.arcSegments);
        if (config.proximity.arcSegments < 4)
            throw ConfigError("canopy::parseConfig(): 'arcSegments' must be at least 4");

        auto *http = section(obj, "http");
        readString(http, "userAgent", config.http.userAgent);
        readInteger(http, "connectTimeoutSeconds", config.http.connectTimeoutSeconds);
        readInteger(http, "timeoutSeconds", config.http.timeoutSeconds);

        return config;
    }

    Config loadConfig(const std::filesystem::path &file) {
        std::ifstream ifs(file);
        if (!ifs) {
            throw ConfigError("canopy::loadConfig(): cannot open \"" + file.string() + '\"');
        }

        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return parseConfig(buffer.str());
    }

} // namespace canopy
