#include "backup/target_descriptor.hpp"
#include "common/utils.hpp"

namespace {

const char* NBD_SCHEME = "nbd://";

} // namespace

std::string TargetEntry::toUrl() const {
    return std::string(NBD_SCHEME) + host + ":" + std::to_string(port) + "/" + exportName;
}

std::string buildTargetDescriptor(const std::vector<TargetEntry>& entries) {
    std::string descriptor;
    for (const auto& entry : entries) {
        if (!descriptor.empty()) {
            descriptor += ',';
        }
        descriptor += entry.diskKey + ":" + entry.toUrl();
    }
    return descriptor;
}

bool parseTargetDescriptor(const std::string& descriptor, std::vector<TargetEntry>& entries,
                           std::string& error) {
    entries.clear();
    if (descriptor.empty()) {
        return true;
    }

    for (const auto& part : utils::split(descriptor, ',')) {
        size_t schemePos = part.find(NBD_SCHEME);
        if (schemePos == std::string::npos || schemePos == 0 || part[schemePos - 1] != ':') {
            error = "malformed target '" + part + "'";
            return false;
        }

        TargetEntry entry;
        entry.diskKey = part.substr(0, schemePos - 1);

        std::string rest = part.substr(schemePos + std::string(NBD_SCHEME).size());
        size_t slash = rest.find('/');
        size_t colon = rest.rfind(':', slash);
        if (slash == std::string::npos || colon == std::string::npos) {
            error = "target '" + part + "' lacks host:port/export";
            return false;
        }

        entry.host = rest.substr(0, colon);
        entry.exportName = rest.substr(slash + 1);
        try {
            entry.port = std::stoi(rest.substr(colon + 1, slash - colon - 1));
        } catch (const std::exception&) {
            error = "target '" + part + "' has an invalid port";
            return false;
        }
        entries.push_back(entry);
    }
    return true;
}

std::string makeExportName(const std::string& vmIdentifier, int diskIndex) {
    return utils::sanitizePathComponent(vmIdentifier) + "-disk" + std::to_string(diskIndex);
}
