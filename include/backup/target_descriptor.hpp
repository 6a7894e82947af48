#pragma once

#include <string>
#include <vector>

// One entry of the combined descriptor: "<diskKey>:nbd://<host>:<port>/<export>"
struct TargetEntry {
    std::string diskKey;
    std::string host;
    int port{0};
    std::string exportName;

    std::string toUrl() const;
};

std::string buildTargetDescriptor(const std::vector<TargetEntry>& entries);
bool parseTargetDescriptor(const std::string& descriptor, std::vector<TargetEntry>& entries,
                           std::string& error);

std::string makeExportName(const std::string& vmIdentifier, int diskIndex);
