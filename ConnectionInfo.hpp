//
// Created by jonas on 09.03.21.
//

#ifndef SAFEVERBS_CONNECTIONINFO_HPP
#define SAFEVERBS_CONNECTIONINFO_HPP

#include <vector>
#include <nlohmann/json.hpp>
#include "EndpointInfo.hpp"
#include "RemoteMemory.hpp"

/**
 * Everything one side tells the other before connecting: its queue pair (or DC target) and the memory it allows the
 * peer to access.
 */
struct ConnectionInfo {
    EndpointInfo endpoint;
    std::vector<RemoteMemory> regions;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ConnectionInfo, endpoint, regions)

#endif //SAFEVERBS_CONNECTIONINFO_HPP
