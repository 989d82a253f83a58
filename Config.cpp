/**
 * @file Config.cpp
 * @author ottojo
 * @date 6/16/21
 */

#include "Config.hpp"
#include "IBvException.hpp"

#include <fstream>

QpCaps QpCaps::forDcInitiator() {
    return QpCaps{
            .maxSendWr = 128,
            .maxRecvWr = 0,
            .maxSendSge = 8,
            .maxRecvSge = 0,
            .maxInlineData = 64,
    };
}

void to_json(nlohmann::json &j, const Config &c) {
    j = nlohmann::json{{"device",       c.context.device},
                       {"port",         c.context.port},
                       {"gidIndex",     c.context.gidIndex},
                       {"cqDepth",      c.cqDepth},
                       {"qp",           c.qp},
                       {"capabilities", c.capabilities},
                       {"verbose",      c.verbose}};
}

void from_json(const nlohmann::json &j, Config &c) {
    const Config defaults;
    c.context.device = j.value("device", defaults.context.device);
    c.context.port = j.value("port", defaults.context.port);
    c.context.gidIndex = j.value("gidIndex", defaults.context.gidIndex);
    c.cqDepth = j.value("cqDepth", defaults.cqDepth);
    c.qp = j.value("qp", defaults.qp);
    c.capabilities = j.value("capabilities", defaults.capabilities);
    c.verbose = j.value("verbose", defaults.verbose);
}

Config loadConfig(const std::string &path) {
    std::ifstream file(path);
    if (not file) {
        throw IBvException(ErrorKind::NotFound, errno, "Opening configuration file " + path);
    }
    return nlohmann::json::parse(file).get<Config>();
}
