#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace trim::driver
{

// One input source, fixed once resolved.
class Target
{
public:
    enum class Kind
    {
        File,
        Stdin
    };

    static Target Stdin();
    static Target File(std::filesystem::path path);

    Kind kind() const { return kind_; }
    bool isStdin() const { return kind_ == Kind::Stdin; }
    const std::filesystem::path& path() const { return path_; }

    // "<stdin>" or the path as given on the command line
    std::string displayName() const;

    bool operator==(const Target& other) const = default;

private:
    Target(Kind kind, std::filesystem::path path);

    Kind kind_;
    std::filesystem::path path_;
};

// No arguments means stdin; "-" anywhere means stdin at that position.
std::vector<Target> ResolveTargets(const std::vector<std::string>& args);

} // namespace trim::driver
