#pragma once

#include <string>
#include <vector>

namespace jp::launch
{

struct LaunchResult
{
    bool success = false;
    std::string message;
};

// Starts a detached process. argv[0] is the executable; the launcher does
// not wait for the child or capture its output.
class IProcessLauncher
{
  public:
    virtual ~IProcessLauncher() noexcept = default;
    virtual LaunchResult launch(std::vector<std::string> const &argv) = 0;
};

class SystemProcessLauncher final : public IProcessLauncher
{
  public:
    LaunchResult launch(std::vector<std::string> const &argv) override;
};

#if defined(_WIN32)
// Quotes one argument following the CommandLineToArgvW rules.
std::string quote_windows_argument(std::string const &argument);
#endif

} // namespace jp::launch
