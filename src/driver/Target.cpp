#include "Target.hpp"

namespace trim::driver
{

namespace
{
constexpr const char* kStdinArg = "-";
constexpr const char* kStdinName = "<stdin>";
} // namespace

Target::Target(Kind kind, std::filesystem::path path)
    : kind_(kind)
    , path_(std::move(path))
{
}

Target Target::Stdin()
{
    return Target(Kind::Stdin, {});
}

Target Target::File(std::filesystem::path path)
{
    return Target(Kind::File, std::move(path));
}

std::string Target::displayName() const
{
    return isStdin() ? kStdinName : path_.string();
}

std::vector<Target> ResolveTargets(const std::vector<std::string>& args)
{
    std::vector<Target> targets;
    if (args.empty())
    {
        targets.push_back(Target::Stdin());
        return targets;
    }

    targets.reserve(args.size());
    for (const auto& arg : args)
    {
        if (arg == kStdinArg)
            targets.push_back(Target::Stdin());
        else
            targets.push_back(Target::File(arg));
    }
    return targets;
}

} // namespace trim::driver
