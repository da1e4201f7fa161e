// Host key verification settings, persisted with QSettings.
#pragma once
#include "HostKeyFetcher.hpp"
#include <memory>
#include <string>

class QSettings;

namespace remotix {

enum class FetcherKind { Keyscan, Libssh2 };

struct Settings {
    std::string keyscanProgram = "ssh-keyscan";
    FetchTimeouts timeouts;
    std::string storeDir;  // empty: TrustStore::defaultDirectory()
    FetcherKind fetcher = FetcherKind::Keyscan;

    // Reads group "HostKeys" from QSettings("Remotix", "Remotix").
    static Settings load();
    static Settings load(QSettings& s);
    void save(QSettings& s) const;
};

bool parseFetcherKind(const std::string& name, FetcherKind& out);
const char* toString(FetcherKind k);

// Build the fetcher selected by the settings.
std::unique_ptr<HostKeyFetcher> makeFetcher(const Settings& s);

} // namespace remotix
