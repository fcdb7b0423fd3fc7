#include "../credentials.hpp"
#include <fstream>
#include <sys/stat.h>

// Credentials stored as simple key=value lines in ~/.tandem/credentials
// File is chmod 600.

std::map<std::string, std::string> CredentialManager::read_all() const {
    std::map<std::string, std::string> m;
    std::ifstream f(store_path_);
    if (!f) return m;

    std::string line;
    while (std::getline(f, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

bool CredentialManager::write_all(const std::map<std::string, std::string>& m) const {
    std::error_code ec;
    fs::create_directories(store_path_.parent_path(), ec);
    if (ec) return false;

    std::ofstream f(store_path_, std::ios::trunc);
    if (!f) return false;

    for (const auto& [k, v] : m) {
        f << k << "=" << v << "\n";
    }
    f.close();
    if (!f) return false;

    chmod(store_path_.c_str(), 0600);
    return true;
}
