#include "ledge/core/MovementConfigLoader.hh"

#include "ledge/core/Log.hh"

#include <sstream>
#include <string>

namespace ledge {

namespace {

std::string formatError(std::string_view source, std::string_view key, std::string_view problem) {
    std::ostringstream oss;
    oss << source << ": key 'movement." << key << "' " << problem;
    return oss.str();
}

std::string formatParseError(std::string_view source, const toml::parse_error& err) {
    std::ostringstream oss;
    oss << source << ":" << err.source().begin.line << ":" << err.source().begin.column << " - " << err.description();
    return oss.str();
}

// Accept both float and integer values; absent keys keep the default
Result<void> readFloat(const toml::table& movement, std::string_view key, std::string_view source, float& out) {
    const toml::node* node = movement.get(key);
    if (!node) {
        return Result<void>::ok();
    }

    if (auto val = node->as_floating_point()) {
        out = static_cast<float>(val->get());
    } else if (auto val = node->as_integer()) {
        out = static_cast<float>(val->get());
    } else {
        return Result<void>::error(ErrorCode::InvalidState, formatError(source, key, "is not a number"));
    }

    if (out <= 0.0f) {
        LEDGE_MOVEMENT_WARN("{}: movement.{} = {} is not positive", source, key, out);
    }
    return Result<void>::ok();
}

Result<void> readLayerMask(const toml::table& movement, std::string_view source, LayerMask& out) {
    constexpr std::string_view key = "wall_layer";
    const toml::node* node = movement.get(key);
    if (!node) {
        return Result<void>::ok();
    }

    if (auto val = node->as_integer()) {
        if (val->get() < 0) {
            return Result<void>::error(ErrorCode::InvalidArgument, formatError(source, key, "must not be negative"));
        }
        out = static_cast<LayerMask>(val->get());
        return Result<void>::ok();
    }

    if (auto arr = node->as_array()) {
        LayerMask mask = 0;
        for (const auto& elem : *arr) {
            auto idx = elem.as_integer();
            if (!idx || idx->get() < 0 || idx->get() >= 32) {
                return Result<void>::error(ErrorCode::InvalidArgument,
                                           formatError(source, key, "must hold layer indices in [0, 31]"));
            }
            mask |= layerBit(static_cast<uint32_t>(idx->get()));
        }
        out = mask;
        return Result<void>::ok();
    }

    return Result<void>::error(ErrorCode::InvalidState,
                               formatError(source, key, "is neither an integer mask nor an array of layers"));
}

} // namespace

Result<MovementConfig> movementConfigFromTable(const toml::table& root, std::string_view sourceName) {
    MovementConfig config;

    const toml::node* section = root.get("movement");
    if (!section) {
        LEDGE_LOG_INFO("{}: no [movement] table, using defaults", sourceName);
        return Result<MovementConfig>::ok(config);
    }

    const toml::table* movement = section->as_table();
    if (!movement) {
        return Result<MovementConfig>::error(ErrorCode::InvalidState,
                                             std::string(sourceName) + ": 'movement' is not a table");
    }

    struct FloatField {
        std::string_view key;
        float* target;
    };
    const FloatField fields[] = {
        {"move_speed", &config.moveSpeed},
        {"jump_force", &config.jumpForce},
        {"wall_jump_force", &config.wallJumpForce},
        {"directed_wall_jump_force", &config.directedWallJumpForce},
        {"wall_slide_speed", &config.wallSlideSpeed},
        {"wall_check_distance", &config.wallCheckDistance},
        {"wall_jump_time", &config.wallJumpTime},
    };

    for (const auto& field : fields) {
        auto read = readFloat(*movement, field.key, sourceName, *field.target);
        if (read.isError()) {
            return Result<MovementConfig>::error(read.code(), read.message());
        }
    }

    auto layer = readLayerMask(*movement, sourceName, config.wallLayer);
    if (layer.isError()) {
        return Result<MovementConfig>::error(layer.code(), layer.message());
    }

    return Result<MovementConfig>::ok(config);
}

Result<MovementConfig> parseMovementConfig(std::string_view tomlContent, std::string_view sourceName) {
    try {
        auto tbl = toml::parse(tomlContent, sourceName);
        return movementConfigFromTable(tbl, sourceName);
    } catch (const toml::parse_error& err) {
        return Result<MovementConfig>::error(ErrorCode::ParseError, formatParseError(sourceName, err));
    }
}

Result<MovementConfig> loadMovementConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Result<MovementConfig>::error(ErrorCode::NotFound, "TOML file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        LEDGE_LOG_DEBUG("Loaded TOML: {}", path.string());
        return movementConfigFromTable(tbl, path.string());
    } catch (const toml::parse_error& err) {
        return Result<MovementConfig>::error(ErrorCode::ParseError, formatParseError(path.string(), err));
    }
}

} // namespace ledge
