// ==============================================================================
// config.cpp - Файл конфигурации
// ==============================================================================

#include "verfold/config.hpp"

#include "verfold/platform.hpp"

#include <memory>
#include <regex>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace verfold::config {

namespace {

/// Прочитать скалярное поле
/// @throws std::runtime_error если значение не скаляр
std::string scalar(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        throw std::runtime_error("field '" + key + "' must be a string");
    }
    return node.as<std::string>();
}

Config parse_config(const YAML::Node& root, const std::filesystem::path& base_dir) {
    Config cfg;

    // Пустой документ - пустая конфигурация
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("config root must be a mapping");
    }

    for (const auto& it : root) {
        const std::string key = it.first.as<std::string>();
        const YAML::Node& value = it.second;

        if (key == "root") {
            std::filesystem::path p = platform::path_from_utf8(scalar(value, key));
            cfg.root = p.is_relative() ? base_dir / p : p;
        } else if (key == "target_version") {
            cfg.target_version = scalar(value, key);
        } else if (key == "encoding") {
            std::string name = scalar(value, key);
            auto enc = io::parse_encoding(name);
            if (!enc.has_value()) {
                throw std::runtime_error("unknown encoding '" + name + "'");
            }
            cfg.encoding = *enc;
        } else if (key == "filter") {
            std::string pattern = scalar(value, key);
            try {
                std::regex compiled(pattern);
                (void)compiled;
            } catch (const std::regex_error& e) {
                throw std::runtime_error("invalid filter regex '" + pattern + "': " + e.what());
            }
            cfg.filter = pattern;
        } else {
            throw std::runtime_error("unknown field '" + key + "'");
        }
    }

    return cfg;
}

}  // namespace

// ----------------------------------------------------------------------------
// Error
// ----------------------------------------------------------------------------

std::string Error::format() const {
    return "failed to load config '" + path + "' - " + message;
}

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

LoadResult load(const std::filesystem::path& path) {
    LoadResult result;
    std::string path_str = platform::path_to_utf8(path);

    try {
        YAML::Node root = YAML::LoadFile(path_str);
        result.config = parse_config(root, path.parent_path());
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), path_str};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), path_str};
    }

    return result;
}

LoadResult load_from_string(const std::string& yaml, const std::filesystem::path& base_dir) {
    LoadResult result;

    try {
        YAML::Node root = YAML::Load(yaml);
        result.config = parse_config(root, base_dir);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), "<string>"};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), "<string>"};
    }

    return result;
}

// ----------------------------------------------------------------------------
// Применение
// ----------------------------------------------------------------------------

NameFilter make_regex_filter(const std::string& pattern) {
    // Выражение компилируется один раз и разделяется копиями фильтра
    auto re = std::make_shared<const std::regex>(pattern);
    return [re](const std::string& name) { return std::regex_search(name, *re); };
}

void apply(const Config& cfg, ResolveOptions& options) {
    if (cfg.root.has_value()) {
        options.root = *cfg.root;
    }
    if (cfg.target_version.has_value()) {
        options.target_version = cfg.target_version;
    }
    if (cfg.encoding.has_value()) {
        options.encoding = *cfg.encoding;
    }
    if (cfg.filter.has_value()) {
        options.filter = make_regex_filter(*cfg.filter);
    }
}

}  // namespace verfold::config
