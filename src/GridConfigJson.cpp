#include "GridConfigJson.hpp"

#include <nlohmann/json.hpp>

#include <limits>

namespace gridflow
{
    namespace
    {
        using nlohmann::json;

        // Reads section[key] into target when present; records a type error otherwise
        void readNumber(const json &section, const std::string &path, const char *key,
                        double &target, std::vector<std::string> &errors)
        {
            if (!section.contains(key))
            {
                return;
            }
            const json &value = section[key];
            if (!value.is_number())
            {
                errors.push_back(path + "." + key + " must be a number");
                return;
            }
            target = value.get<double>();
        }

        template <typename T>
        void readUnsigned(const json &section, const std::string &path, const char *key,
                          T &target, std::vector<std::string> &errors)
        {
            if (!section.contains(key))
            {
                return;
            }
            const json &value = section[key];
            if (!value.is_number_unsigned())
            {
                errors.push_back(path + "." + key + " must be an unsigned number");
                return;
            }
            const auto raw = value.get<uint64_t>();
            if (raw > std::numeric_limits<T>::max())
            {
                errors.push_back(path + "." + key + " is out of range");
                return;
            }
            target = static_cast<T>(raw);
        }

        const json *findSection(const json &root, const char *name, std::vector<std::string> &errors)
        {
            if (!root.contains(name))
            {
                return nullptr;
            }
            const json &section = root[name];
            if (!section.is_object())
            {
                errors.push_back(std::string(name) + " must be an object");
                return nullptr;
            }
            return &section;
        }
    }

    std::string gridConfigToJson(const GridConfig &config)
    {
        json root;

        root["network"] = {
            {"grid_size", config.network.grid_size},
            {"block_size", config.network.block_size},
            {"road_width", config.network.road_width},
            {"lane_offset", config.network.lane_offset},
            {"junction_control_scale", config.network.junction_control_scale},
            {"max_turn_angle_ratio", config.network.max_turn_angle_ratio}};

        root["signals"] = {
            {"green_seconds", config.signals.green_seconds},
            {"yellow_seconds", config.signals.yellow_seconds},
            {"all_red_seconds", config.signals.all_red_seconds}};

        root["driver"] = {
            {"desired_speed", config.driver.desired_speed},
            {"time_headway", config.driver.time_headway},
            {"max_acceleration", config.driver.max_acceleration},
            {"comfortable_braking", config.driver.comfortable_braking},
            {"jam_distance", config.driver.jam_distance},
            {"emergency_brake_factor", config.driver.emergency_brake_factor},
            {"gap_floor", config.driver.gap_floor}};

        root["traffic"] = {
            {"car_count", config.traffic.car_count},
            {"car_length", config.traffic.car_length},
            {"min_gap", config.traffic.min_gap},
            {"stop_margin", config.traffic.stop_margin},
            {"lookahead_distance", config.traffic.lookahead_distance},
            {"free_gap", config.traffic.free_gap},
            {"braking_threshold", config.traffic.braking_threshold},
            {"low_speed_ratio", config.traffic.low_speed_ratio}};

        root["timing"] = {
            {"physics_hz", config.timing.physics_hz},
            {"max_frame_seconds", config.timing.max_frame_seconds}};

        root["seed"] = config.seed;

        return root.dump();
    }

    ConfigParseResult gridConfigFromJson(const std::string &json_text)
    {
        ConfigParseResult result;

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            result.errors.push_back("root must be an object");
            return result;
        }

        GridConfig &config = result.config;
        std::vector<std::string> &errors = result.errors;

        if (const json *network = findSection(root, "network", errors))
        {
            readUnsigned(*network, "network", "grid_size", config.network.grid_size, errors);
            readNumber(*network, "network", "block_size", config.network.block_size, errors);
            readNumber(*network, "network", "road_width", config.network.road_width, errors);
            readNumber(*network, "network", "lane_offset", config.network.lane_offset, errors);
            readNumber(*network, "network", "junction_control_scale", config.network.junction_control_scale, errors);
            readNumber(*network, "network", "max_turn_angle_ratio", config.network.max_turn_angle_ratio, errors);
        }

        if (const json *signals = findSection(root, "signals", errors))
        {
            readNumber(*signals, "signals", "green_seconds", config.signals.green_seconds, errors);
            readNumber(*signals, "signals", "yellow_seconds", config.signals.yellow_seconds, errors);
            readNumber(*signals, "signals", "all_red_seconds", config.signals.all_red_seconds, errors);
        }

        if (const json *driver = findSection(root, "driver", errors))
        {
            readNumber(*driver, "driver", "desired_speed", config.driver.desired_speed, errors);
            readNumber(*driver, "driver", "time_headway", config.driver.time_headway, errors);
            readNumber(*driver, "driver", "max_acceleration", config.driver.max_acceleration, errors);
            readNumber(*driver, "driver", "comfortable_braking", config.driver.comfortable_braking, errors);
            readNumber(*driver, "driver", "jam_distance", config.driver.jam_distance, errors);
            readNumber(*driver, "driver", "emergency_brake_factor", config.driver.emergency_brake_factor, errors);
            readNumber(*driver, "driver", "gap_floor", config.driver.gap_floor, errors);
        }

        if (const json *traffic = findSection(root, "traffic", errors))
        {
            readUnsigned(*traffic, "traffic", "car_count", config.traffic.car_count, errors);
            readNumber(*traffic, "traffic", "car_length", config.traffic.car_length, errors);
            readNumber(*traffic, "traffic", "min_gap", config.traffic.min_gap, errors);
            readNumber(*traffic, "traffic", "stop_margin", config.traffic.stop_margin, errors);
            readNumber(*traffic, "traffic", "lookahead_distance", config.traffic.lookahead_distance, errors);
            readNumber(*traffic, "traffic", "free_gap", config.traffic.free_gap, errors);
            readNumber(*traffic, "traffic", "braking_threshold", config.traffic.braking_threshold, errors);
            readNumber(*traffic, "traffic", "low_speed_ratio", config.traffic.low_speed_ratio, errors);
        }

        if (const json *timing = findSection(root, "timing", errors))
        {
            readNumber(*timing, "timing", "physics_hz", config.timing.physics_hz, errors);
            readNumber(*timing, "timing", "max_frame_seconds", config.timing.max_frame_seconds, errors);
        }

        if (root.contains("seed"))
        {
            if (!root["seed"].is_number_unsigned() || root["seed"].get<uint64_t>() > std::numeric_limits<uint32_t>::max())
            {
                errors.push_back("seed must be an unsigned 32-bit number");
            }
            else
            {
                config.seed = root["seed"].get<uint32_t>();
            }
        }

        result.ok = result.errors.empty();
        return result;
    }

    std::string validationErrorsToJson(const std::vector<std::string> &errors)
    {
        nlohmann::json root;
        root["ok"] = false;
        root["errors"] = errors;
        return root.dump();
    }
} // namespace gridflow
