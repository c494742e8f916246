#include <stackup/config.hpp>
#include <stackup/log.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace stackup {

namespace fs = std::filesystem;

static Result<std::vector<std::string>> string_array(const toml::node_view<toml::node>& node,
                                                     const char* key) {
    std::vector<std::string> out;
    auto arr = node.as_array();
    if (!arr) {
        return StackupError{StackupError::Config,
            std::string("'") + key + "' must be an array of strings"};
    }
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) {
            return StackupError{StackupError::Config,
                std::string("'") + key + "' must contain only strings"};
        }
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

static void read_bool(const toml::table& tbl, const char* key, bool& field, bool& set) {
    if (auto v = tbl[key].value<bool>()) {
        field = *v;
        set = true;
    }
}

Config Config::defaults() {
    Config cfg;
    cfg.tool.path = "stack";
    cfg.tool.package_query = {"ghc-pkg", "list", "--simple-output"};
    cfg.log_level = "info";
    return cfg;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StackupError{StackupError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [tool]
    if (auto tool = doc["tool"].as_table()) {
        if (auto v = (*tool)["path"].value<std::string>()) cfg.tool.path = *v;
        if ((*tool)["package-query"]) {
            auto q = string_array((*tool)["package-query"], "tool.package-query");
            if (q.is_err()) return std::move(q).error();
            cfg.tool.package_query = std::move(q).value();
        }
    }

    // [behavior]
    if (auto b = doc["behavior"].as_table()) {
        read_bool(*b, "auto-target", cfg.behavior.auto_target, cfg.auto_target_set);
        read_bool(*b, "edit-before-run", cfg.behavior.edit_before_run, cfg.edit_before_run_set);
        read_bool(*b, "auto-open-coverage-reports",
                  cfg.behavior.auto_open_coverage, cfg.auto_open_coverage_set);
        read_bool(*b, "auto-open-haddocks",
                  cfg.behavior.auto_open_haddock, cfg.auto_open_haddock_set);
        read_bool(*b, "auto-newest-version",
                  cfg.behavior.auto_newest_version, cfg.auto_newest_version_set);
        if (auto q = (*b)["quote"].value<std::string>()) {
            if (*q == "minimal") {
                cfg.behavior.quote = QuoteMode::Minimal;
            } else if (*q == "always") {
                cfg.behavior.quote = QuoteMode::Always;
            } else {
                return StackupError{StackupError::Config,
                    "unknown quote mode '" + *q + "'", "use \"minimal\" or \"always\""};
            }
            cfg.quote_set = true;
        }
    }

    // [project]
    if (auto p = doc["project"].as_table()) {
        if ((*p)["markers"]) {
            auto m = string_array((*p)["markers"], "project.markers");
            if (m.is_err()) return std::move(m).error();
            if (m.value().empty()) {
                return StackupError{StackupError::Config, "'project.markers' is empty"};
            }
            cfg.layout.markers = std::move(m).value();
            cfg.markers_set = true;
        }
        if (auto v = (*p)["compound-marker"].value<std::string>()) {
            cfg.layout.compound_marker = *v;
            cfg.compound_marker_set = true;
        }
        if (auto v = (*p)["manifest-extension"].value<std::string>()) {
            cfg.layout.manifest_extension = *v;
            cfg.manifest_extension_set = true;
        }
    }

    // [log]
    if (auto l = doc["log"].as_table()) {
        if (auto v = (*l)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = *v;
        }
        if (auto v = (*l)["dir"].value<std::string>()) cfg.log_dir = *v;
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StackupError{StackupError::IO, "cannot open config file", "", path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        StackupError err = std::move(cfg).error();
        err.path = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (!other.tool.path.empty()) tool.path = other.tool.path;
    if (!other.tool.package_query.empty()) tool.package_query = other.tool.package_query;

    if (other.auto_target_set) {
        behavior.auto_target = other.behavior.auto_target;
        auto_target_set = true;
    }
    if (other.edit_before_run_set) {
        behavior.edit_before_run = other.behavior.edit_before_run;
        edit_before_run_set = true;
    }
    if (other.auto_open_coverage_set) {
        behavior.auto_open_coverage = other.behavior.auto_open_coverage;
        auto_open_coverage_set = true;
    }
    if (other.auto_open_haddock_set) {
        behavior.auto_open_haddock = other.behavior.auto_open_haddock;
        auto_open_haddock_set = true;
    }
    if (other.auto_newest_version_set) {
        behavior.auto_newest_version = other.behavior.auto_newest_version;
        auto_newest_version_set = true;
    }
    if (other.quote_set) {
        behavior.quote = other.behavior.quote;
        quote_set = true;
    }

    if (other.markers_set) {
        layout.markers = other.layout.markers;
        markers_set = true;
    }
    if (other.compound_marker_set) {
        layout.compound_marker = other.layout.compound_marker;
        compound_marker_set = true;
    }
    if (other.manifest_extension_set) {
        layout.manifest_extension = other.layout.manifest_extension;
        manifest_extension_set = true;
    }

    if (!other.log_level.empty()) log_level = other.log_level;
    if (!other.log_dir.empty()) log_dir = other.log_dir;
}

Result<Config> Config::effective(const fs::path& project_root) {
    Config result = Config::defaults();

    std::vector<std::string> layers;
    std::string gpath = global_config_path();
    if (!gpath.empty()) layers.push_back(gpath);
    if (!project_root.empty()) layers.push_back(project_config_path(project_root).string());

    for (const auto& path : layers) {
        std::error_code ec;
        if (!fs::exists(path, ec)) continue;
        auto layer = Config::load(path);
        if (layer.is_err()) return std::move(layer).error();
        log::debug("config layer: %s", path.c_str());
        result.merge(layer.value());
    }

    return Result<Config>::ok(std::move(result));
}

Status Config::apply_logging() const {
    if (log_level.empty()) return ok_status();
    auto lvl = log::parse_level(log_level);
    if (lvl.is_err()) return std::move(lvl).error();
    log::set_level(lvl.value());
    return ok_status();
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.stackup/config.toml";
}

fs::path project_config_path(const fs::path& project_root) {
    return project_root / ".stackup.toml";
}

} // namespace stackup
