//! # Network Reachability
//!
//! Before a strategy that needs a package index runs, the resolver asks a
//! `NetworkChecker` whether the index host answers. An unreachable index is
//! reported as its own attempt status instead of a generic installer failure.

#ifndef LSPACK_PROCESS_NETWORK_CHECKER_HPP
#define LSPACK_PROCESS_NETWORK_CHECKER_HPP

#include <string>

namespace lspack::proc {

/// Splits "https://host:port/path" into host and port. Defaults the port from
/// the scheme (443 for https, 80 for http). Returns false if no host is found.
bool split_url_host(const std::string& url, std::string& host, int& port);

class NetworkChecker {
public:
    virtual ~NetworkChecker() = default;

    /// True if a TCP connection to the URL's host can be opened.
    virtual bool reachable(const std::string& url) = 0;
};

/// Resolves the host with getaddrinfo and attempts a non-blocking connect
/// bounded by `timeout_ms`. Results are cached per host:port for the run.
class SocketNetworkChecker : public NetworkChecker {
public:
    explicit SocketNetworkChecker(int timeout_ms = 3000) : timeout_ms_(timeout_ms) {}

    bool reachable(const std::string& url) override;

private:
    int timeout_ms_;
    std::string last_key_;
    bool last_result_ = false;
};

/// Answers false for every URL (`--offline`).
class OfflineNetworkChecker : public NetworkChecker {
public:
    bool reachable(const std::string& /*url*/) override {
        return false;
    }
};

} // namespace lspack::proc

#endif // LSPACK_PROCESS_NETWORK_CHECKER_HPP
