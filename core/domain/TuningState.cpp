#include "TuningState.hpp"
#include "../JsonCodec.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace uplink::domain {

TuningStateRepository::TuningStateRepository(std::string path, TuningState defaults)
    : path_(std::move(path)), defaults_(defaults), state_(defaults) {
}

bool TuningStateRepository::load() {
    state_ = defaults_;
    if (path_.empty()) {
        return true;
    }
    
    std::ifstream file(path_);
    if (!file.is_open()) {
        std::cout << "[TuningState] No state at " << path_ << ", using defaults" << std::endl;
        return false;
    }
    
    std::stringstream buffer;
    buffer << file.rdbuf();
    
    auto parsed = JsonCodec::decodeTuningState(buffer.str(), defaults_);
    if (!parsed) {
        std::cerr << "[TuningState] Warning: unreadable state at " << path_
                  << ", using defaults" << std::endl;
        return false;
    }
    
    state_ = *parsed;
    return true;
}

bool TuningStateRepository::flush() {
    if (path_.empty()) {
        return true;
    }
    
    namespace fs = std::filesystem;
    const std::string tempPath = path_ + ".tmp";
    
    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "[TuningState] Failed to open " << tempPath << " for writing" << std::endl;
            return false;
        }
        file << JsonCodec::encodeTuningState(state_);
        file.flush();
        if (!file.good()) {
            std::cerr << "[TuningState] Failed to write " << tempPath << std::endl;
            return false;
        }
    }
    
    std::error_code ec;
    fs::rename(tempPath, path_, ec);
    if (ec) {
        std::cerr << "[TuningState] Failed to replace " << path_ << ": " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

bool TuningStateRepository::update(const std::function<void(TuningState&)>& mutation) {
    mutation(state_);
    return flush();
}

} // namespace uplink::domain
