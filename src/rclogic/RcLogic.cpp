#include "rclogic/RcLogic.hpp"
#include "rclogic/utils/Logger.hpp"

#include <iostream>

namespace rclogic {

RCLOGIC_API bool initialize(const std::string& log_file_path, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, Logger::Level::INFO, enable_console);
        RCLOGIC_LOG_INFO("RcLogic library initialized successfully");
        RCLOGIC_LOG_INFO("Version: {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统不可用，只能输出到标准错误
        if (enable_console) {
            std::cerr << "Failed to initialize RcLogic: " << e.what() << std::endl;
        }
        return false;
    }
}

RCLOGIC_API void cleanup() {
    RCLOGIC_LOG_INFO("RcLogic library cleanup completed");
    Logger::getInstance().shutdown();
}

} // namespace rclogic
