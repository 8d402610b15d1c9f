// wave2d_config.cpp
#include "wave2d_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace {

int parse_int(const std::string& key, const std::string& value) {
    std::size_t pos = 0;
    int out = 0;
    try {
        out = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer for " + key + ": " + value);
    }
    if (pos != value.size()) {
        throw std::runtime_error("Invalid integer for " + key + ": " + value);
    }
    return out;
}

double parse_double(const std::string& key, const std::string& value) {
    std::size_t pos = 0;
    double out = 0.0;
    try {
        out = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid number for " + key + ": " + value);
    }
    if (pos != value.size()) {
        throw std::runtime_error("Invalid number for " + key + ": " + value);
    }
    return out;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "1" || value == "true" || value == "on")
        return true;
    if (value == "0" || value == "false" || value == "off")
        return false;
    throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}

Wave2DRunConfig::Mode parse_mode(const std::string& value) {
    if (value == "solve")
        return Wave2DRunConfig::Mode::solve;
    if (value == "convergence")
        return Wave2DRunConfig::Mode::convergence;
    throw std::runtime_error("Invalid mode: " + value);
}

// "key=value" を分割。'=' が無ければ例外
void split_entry(const std::string& entry, std::string& key, std::string& value) {
    const std::size_t eq = entry.find('=');
    if (eq == std::string::npos) {
        throw std::runtime_error("Expected key=value, got: " + entry);
    }
    key   = trim_copy(entry.substr(0, eq));
    value = trim_copy(entry.substr(eq + 1));
    if (key.empty()) {
        throw std::runtime_error("Empty key in: " + entry);
    }
}

} // namespace

std::string trim_copy(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(input.rbegin(), input.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end)
        return std::string();
    return std::string(begin, end);
}

void apply_config_entry(Wave2DRunConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "mode")
        cfg.mode = parse_mode(value);
    else if (key == "N")
        cfg.params.N = parse_int(key, value);
    else if (key == "Nt")
        cfg.params.Nt = parse_int(key, value);
    else if (key == "cfl")
        cfg.params.cfl = parse_double(key, value);
    else if (key == "c")
        cfg.params.c = parse_double(key, value);
    else if (key == "mx")
        cfg.params.mx = parse_int(key, value);
    else if (key == "my")
        cfg.params.my = parse_int(key, value);
    else if (key == "store_every")
        cfg.params.store_every = parse_int(key, value);
    else if (key == "verbose")
        cfg.verbose = parse_bool(key, value);
    else if (key == "conv_levels")
        cfg.conv_levels = parse_int(key, value);
    else if (key == "conv_cfl")
        cfg.conv_cfl = parse_double(key, value);
    else if (key == "conv_Nt")
        cfg.conv_Nt = parse_int(key, value);
    else
        throw std::runtime_error("Unknown config key: " + key);
}

void parse_config_file(const std::string& path, Wave2DRunConfig& cfg) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const std::size_t hash = line.find('#');
        if (hash != std::string::npos)
            line.erase(hash);
        line = trim_copy(line);
        if (line.empty())
            continue;

        std::string key, value;
        try {
            split_entry(line, key, value);
            apply_config_entry(cfg, key, value);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) + ": " + e.what());
        }
    }
}

Wave2DRunConfig parse_config_args(const std::vector<std::string>& args) {
    Wave2DRunConfig cfg;

    // config=<path> を先に読む (コマンドライン側が優先)
    for (const auto& arg : args) {
        std::string key, value;
        split_entry(arg, key, value);
        if (key == "config")
            parse_config_file(value, cfg);
    }

    for (const auto& arg : args) {
        std::string key, value;
        split_entry(arg, key, value);
        if (key != "config")
            apply_config_entry(cfg, key, value);
    }
    return cfg;
}
