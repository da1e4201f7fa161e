#include "remotix/Context.hpp"

namespace remotix {

Context::Context(std::unique_ptr<RemoteClient> prototype,
                 std::unique_ptr<HostKeyFetcher> fetcher,
                 const std::string& storeDir)
    : trust_(storeDir),
      verifier_(std::move(fetcher), trust_),
      connections_(std::move(prototype)) {}

Context::Context(std::unique_ptr<RemoteClient> prototype, const Settings& settings)
    : Context(std::move(prototype), makeFetcher(settings), settings.storeDir) {}

} // namespace remotix
