#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct ImageInfo {
    std::string path;
    std::string format;
    uint64_t virtualSize{0};
    uint64_t actualSize{0};
    std::string backingFile;  // empty for standalone images
    bool dirty{false};
};

// Copy-on-write image operations used by the chain manager
class ImageManager {
public:
    virtual ~ImageManager() = default;

    virtual bool createFull(const std::string& path, uint64_t sizeBytes, std::string& error) = 0;
    // backingPath is recorded format-qualified (qcow2) in the new image
    virtual bool createIncremental(const std::string& path, const std::string& backingPath,
                                   std::string& error) = 0;
    virtual bool getInfo(const std::string& path, ImageInfo& info, std::string& error) = 0;
    virtual bool check(const std::string& path, std::string& error) = 0;
    virtual bool remove(const std::string& path, std::string& error);
    virtual bool exists(const std::string& path) const;
};

class Qcow2ImageManager : public ImageManager {
public:
    explicit Qcow2ImageManager(const std::string& qemuImgBinary = "qemu-img");

    bool createFull(const std::string& path, uint64_t sizeBytes, std::string& error) override;
    bool createIncremental(const std::string& path, const std::string& backingPath,
                           std::string& error) override;
    bool getInfo(const std::string& path, ImageInfo& info, std::string& error) override;
    bool check(const std::string& path, std::string& error) override;

    // Parses `qemu-img info --output=json`
    static bool parseInfo(const std::string& jsonText, ImageInfo& info, std::string& error);

private:
    bool run(const std::vector<std::string>& args, std::string& output, std::string& error);
    static bool ensureParentDirectory(const std::string& path, std::string& error);

    std::string qemuImg_;
};
