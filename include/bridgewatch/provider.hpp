// Provider.hpp
#pragma once

#include <cstdint>
#include <forward_list>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <optional>
#include <queue>
#include <chrono>
#include <mutex>
#include <vector>

#include <cpr/cprtypes.h>
#include <cpr/response.h>
#include <cpr/session.h>
#include <nlohmann/json_fwd.hpp>

#include "ledger_client.hpp"
#include "logs.hpp"

using namespace std::literals;

namespace bridgewatch
{
struct Client {
    std::string name;
    cpr::Url url;
};

/// Why a JSON-RPC request produced no result.  `fatal` is set when the failure cannot be cured
/// by retrying against the same client (rejected credentials, unsupported URL scheme, a method
/// the node does not serve).
struct RpcError {
    bool fatal{false};
    std::string message;
};

template <typename Ret>
struct RpcResult {
    std::optional<Ret> value;
    RpcError error;

    explicit operator bool() const { return value.has_value(); }
};

/// Classifies a finished HTTP exchange with a JSON-RPC node and extracts its "result" member.
RpcResult<nlohmann::json> get_json_result(const cpr::Response& r);

struct Provider : public LedgerClient, public std::enable_shared_from_this<Provider> {

protected:
    Provider();
public:

    ~Provider() override;

    static std::shared_ptr<Provider> make_provider() {
        return std::shared_ptr<Provider>{new Provider{}};
    }

    template <typename Ret>
    using result_callback = std::function<void(RpcResult<Ret>)>;

    using json_result_callback = result_callback<nlohmann::json>;

    /** Add a RPC backend for interacting with the source network.
     *
     * @param name A label for the type of client being added. This information
     * is stored only for the user to identify the client in the list of
     * clients in a given provider.
     *
     * Throws std::invalid_argument if the `url` is empty or was already added.
     */
    void addClient(std::string name, std::string url);

    // Updates the request timeout used for new requests
    void setTimeout(std::chrono::milliseconds timeout);

    // The default timeout applied (if setTimeout is not called)
    static constexpr auto DEFAULT_TIMEOUT = 3s;

    uint64_t getNetworkChainId();
    void getNetworkChainIdAsync(result_callback<uint64_t> user_cb);

    std::vector<LogEntry> getLogs(uint64_t fromBlock, uint64_t toBlock, std::string_view address, std::string_view topic);
    void getLogsAsync(uint64_t fromBlock, uint64_t toBlock, std::string_view address, std::string_view topic, result_callback<std::vector<LogEntry>> user_cb);

    uint64_t getLatestHeight() override;
    void getLatestHeightAsync(result_callback<uint64_t> user_cb);

    std::vector<LogEntry> getEvents(uint64_t fromHeight, uint64_t toHeight, const EventSelector& selector) override;

    size_t numClients();

    std::vector<Client> getClients();

    void makeJsonRpcRequest(std::string_view method,
                                     const nlohmann::json& params,
                                     json_result_callback cb,
                                     std::forward_list<size_t> client_indices = {},
                                     bool should_try_next = true);
    RpcResult<nlohmann::json> makeJsonRpcRequest(std::string_view method,
                                     const nlohmann::json& params,
                                     std::forward_list<size_t> client_indices = {},
                                     bool should_try_next = true);

private:

    // Continues a request after earlier clients in the order failed; `all_fatal` tracks whether
    // every client tried so far failed fatally.
    void dispatchJsonRpcRequest(std::string_view method,
                                     const nlohmann::json& params,
                                     json_result_callback cb,
                                     std::forward_list<size_t> client_indices,
                                     bool should_try_next,
                                     bool all_fatal);

    /// List of clients for interacting with the network via RPC
    /// The order of the clients dictates the order in which a request is
    /// attempted.
    std::vector<Client> clients;

    std::vector<size_t> client_order;

    std::map<std::string, std::queue<std::shared_ptr<cpr::Session>>> client_sessions;

    // Gets or creates a cpr Session for the given URL (if it is added in clients)
    // This function DOES NOT lock the mutex; it assumes the caller already has!
    std::shared_ptr<cpr::Session> get_client_session(const std::string& url);

    std::chrono::milliseconds request_timeout{DEFAULT_TIMEOUT};

    std::mutex mutex;
};
}; // namespace bridgewatch
