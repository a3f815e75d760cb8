#pragma once

#include <IResponse.hpp>
#include <CommandException.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <iostream>

namespace copytrader::adapters::primary {

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setResult(status, "application/json", body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

/**
 * @brief Перевести исключение сервиса в HTTP ответ
 *
 * CommandException несёт свой код (404, 409, 422), ошибки разбора JSON дают 400,
 * остальное 500.
 */
inline void sendException(IResponse& res, const std::string& component, const std::exception& e) {
    if (auto command = dynamic_cast<const CommandException*>(&e)) {
        sendError(res, command->code(), command->what());
        return;
    }
    if (dynamic_cast<const nlohmann::json::exception*>(&e)) {
        sendError(res, 400, std::string("Invalid JSON: ") + e.what());
        return;
    }
    std::cerr << "[" << component << "] Error: " << e.what() << std::endl;
    sendError(res, 500, "Internal server error");
}

} // namespace copytrader::adapters::primary
