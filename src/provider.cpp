// provider.cpp
#include <chrono>
#include <future>
#include <limits>

#include <cpr/cpr.h>
#pragma GCC diagnostic push
#ifndef __clang__
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#include <nlohmann/json.hpp>
#pragma GCC diagnostic pop

#include <oxen/log.hpp>

#include "bridgewatch/errors.hpp"
#include "bridgewatch/provider.hpp"
#include "bridgewatch/utils.hpp"

namespace
{
auto logcat = oxen::log::Cat("provider");

// JSON-RPC "method not found": the endpoint is not an Ethereum-style node at all
constexpr int JSONRPC_METHOD_NOT_FOUND = -32601;
}

namespace bridgewatch
{
namespace log = oxen::log;

template<typename T = nlohmann::json>
struct JsonResultWaiter
{
    std::promise<RpcResult<T>> p;
    std::future<RpcResult<T>> fut;
    JsonResultWaiter() : fut{p.get_future()} {}

    Provider::result_callback<T> cb() {
        return [this](RpcResult<T> r) {
            p.set_value(std::move(r));
        };
    }

    auto get() { return fut.get(); }
};

// Turns a failed result into the exception the scanner classifies on
template <typename T>
static T unwrap(RpcResult<T> result, std::string_view what)
{
    if (result)
        return std::move(*result.value);
    auto msg = std::string{what} + ": " + result.error.message;
    if (result.error.fatal)
        throw LedgerFatal{msg};
    throw LedgerUnavailable{msg};
}

template <typename T>
static RpcResult<T> failed(RpcError error)
{
    return RpcResult<T>{std::nullopt, std::move(error)};
}

Provider::Provider()
{
    setTimeout(DEFAULT_TIMEOUT);
}

Provider::~Provider()
{
}

void Provider::setTimeout(std::chrono::milliseconds timeout) {
    std::lock_guard lk{mutex};
    this->request_timeout = timeout;
}

void Provider::addClient(std::string name, std::string url) {
    if (url.empty())
        throw std::invalid_argument{"Provider URL is empty."};
    std::lock_guard lk{mutex};
    for (const auto& client : clients)
    {
        if (client.url.str() == url)
            throw std::invalid_argument{"Provider URL was already added."};
    }
    log::debug(logcat, "Adding provider client '{}' at {}", name, url);
    clients.emplace_back(Client{std::move(name), std::move(url)});
    client_order.push_back(clients.size() - 1);
}

size_t Provider::numClients()
{
    std::lock_guard lk{mutex};
    return clients.size();
}

std::vector<Client> Provider::getClients()
{
    std::lock_guard lk{mutex};
    return clients;
}

std::shared_ptr<cpr::Session> Provider::get_client_session(const std::string& url)
{
    if (url.empty())
        throw std::invalid_argument{"Attempting to get session for empty URL"};

    auto& sessions = client_sessions[url];
    if (sessions.empty())
    {
        auto session = std::make_shared<cpr::Session>();
        session->SetUrl(url);
        session->SetTimeout(request_timeout);
        return session;
    }
    auto session = std::move(sessions.front());
    sessions.pop();
    session->SetTimeout(request_timeout);

    return session;
}

RpcResult<nlohmann::json> get_json_result(const cpr::Response& r)
{
    if (r.error.code != cpr::ErrorCode::OK)
    {
        log::debug(logcat, "http request failed with transport error \"{}\"", r.error.message);
        return failed<nlohmann::json>({r.error.code == cpr::ErrorCode::UNSUPPORTED_PROTOCOL,
                "transport error: " + r.error.message});
    }
    if (r.status_code != 200)
    {
        log::debug(logcat, "http request returned status code {} with message \"{}\"", r.status_code, r.text);
        bool auth_rejected = r.status_code == 401 || r.status_code == 403;
        return failed<nlohmann::json>({auth_rejected, "http status " + std::to_string(r.status_code)});
    }
    try
    {
        log::trace(logcat, "parsing json rpc result, r.text = \"{}\"", r.text);
        auto responseJson = nlohmann::json::parse(r.text);
        if (auto it = responseJson.find("error"); it != responseJson.end() && !it->is_null())
        {
            log::warning(logcat, "json rpc error: {}", it->dump());
            int code = it->value("code", 0);
            std::string message = it->value("message", std::string{"unknown error"});
            return failed<nlohmann::json>({code == JSONRPC_METHOD_NOT_FOUND,
                    "json rpc error " + std::to_string(code) + ": " + message});
        }
        if (responseJson.contains("result") and not responseJson["result"].is_null())
        {
            return RpcResult<nlohmann::json>{std::move(responseJson["result"]), {}};
        }
        log::warning(logcat, "json response missing \"result\" field (or is null), response: {}", responseJson.dump());
        return failed<nlohmann::json>({false, "json response missing result"});
    }
    catch (const std::exception& e)
    {
        log::debug(logcat, "json response failed to parse: {}", e.what());
        return failed<nlohmann::json>({false, std::string{"malformed json response: "} + e.what()});
    }
}

void Provider::makeJsonRpcRequest(std::string_view method,
        const nlohmann::json& params,
        json_result_callback cb,
        std::forward_list<size_t> client_indices,
        bool should_try_next) {
    dispatchJsonRpcRequest(method, params, std::move(cb), std::move(client_indices), should_try_next, true);
}

void Provider::dispatchJsonRpcRequest(std::string_view method,
        const nlohmann::json& params,
        json_result_callback cb,
        std::forward_list<size_t> client_indices,
        bool should_try_next,
        bool all_fatal) {

    std::unique_lock lock{mutex};
    if (clients.empty()) {
      throw std::runtime_error(
          "No clients were set for the provider. Ensure that a client was "
          "added to the provider before issuing a request.");
    }

    if (client_indices.empty())
        client_indices = {client_order.begin(), client_order.end()};

    auto client_index = client_indices.front();
    client_indices.pop_front();

    if (client_index >= clients.size())
    {
        log::debug(logcat, "Attempting to use provider client with index ({}) out of bounds.", client_index);
        lock.unlock();
        cb(failed<nlohmann::json>({false, "provider client index out of bounds"}));
        return;
    }

    nlohmann::json bodyJson;
    bodyJson["jsonrpc"] = "2.0";
    bodyJson["method"]  = method;
    bodyJson["params"]  = params;
    bodyJson["id"]      = 1;
    log::debug(logcat, "making rpc request to client {} with body {}", client_index, bodyJson.dump());
    cpr::Body body(bodyJson.dump());

    auto url = clients[client_index].url.str();
    auto session = get_client_session(url);
    session->SetBody(body);
    session->SetHeader({{"Content-Type", "application/json"}});
    auto post_cb = [self=weak_from_this(), cb=std::move(cb), url=std::move(url), session, method=std::string{method}, params, client_indices=std::move(client_indices), should_try_next, all_fatal](cpr::Response r) mutable {
        auto ptr = self.lock();

        if (not ptr)
            return; // Provider is gone, drop response
        std::unique_lock lk{ptr->mutex};

        ptr->client_sessions[url].push(std::move(session));
        lk.unlock();

        auto result = get_json_result(r);
        if (result)
        {
            log::debug(logcat, "{} returning: {}", method, result.value->dump());
            cb(std::move(result));
            return;
        }

        all_fatal = all_fatal && result.error.fatal;
        log::warning(logcat, "{} failed against {}: {}", method, url, result.error.message);

        if (should_try_next and not client_indices.empty())
        {
            ptr->dispatchJsonRpcRequest(method, params, std::move(cb), std::move(client_indices), true, all_fatal);
            return;
        }
        // A fatal failure on one client only condemns the request if every fallback agreed
        result.error.fatal = all_fatal;
        cb(std::move(result));
    };
    lock.unlock();
    auto result_future = session->PostCallback(std::move(post_cb));
}

RpcResult<nlohmann::json> Provider::makeJsonRpcRequest(std::string_view method,
                                 const nlohmann::json& params,
                                 std::forward_list<size_t> client_indices,
                                 bool should_try_next)
{
    JsonResultWaiter waiter;
    makeJsonRpcRequest(method, params, waiter.cb(), std::move(client_indices), should_try_next);
    return waiter.get();
}

uint64_t Provider::getNetworkChainId() {
    JsonResultWaiter<uint64_t> waiter;
    getNetworkChainIdAsync(waiter.cb());
    return unwrap(waiter.get(), "Unable to get network chain id");
}

void Provider::getNetworkChainIdAsync(result_callback<uint64_t> user_cb)
{
    nlohmann::json params = nlohmann::json::array();
    auto cb = [user_cb=std::move(user_cb)](RpcResult<nlohmann::json> r) {
        if (!r)
        {
            user_cb(failed<uint64_t>(std::move(r.error)));
            return;
        }

        try
        {
            user_cb(RpcResult<uint64_t>{utils::hexStringToU64(r.value->get<std::string>()), {}});
        }
        catch (const std::exception& e)
        {
            log::warning(logcat, "Failed to parse chain id from json rpc response: {}", r.value->dump());
            user_cb(failed<uint64_t>({false, std::string{"unparseable eth_chainId result: "} + e.what()}));
        }
    };
    makeJsonRpcRequest("eth_chainId", params, std::move(cb));
}

std::vector<LogEntry> Provider::getLogs(uint64_t fromBlock, uint64_t toBlock, std::string_view address, std::string_view topic) {
    JsonResultWaiter<std::vector<LogEntry>> waiter;
    getLogsAsync(fromBlock, toBlock, address, topic, waiter.cb());
    return unwrap(waiter.get(), "Error in json rpc eth_getLogs");
}

void Provider::getLogsAsync(uint64_t fromBlock, uint64_t toBlock, std::string_view address, std::string_view topic, result_callback<std::vector<LogEntry>> user_cb)
{
    nlohmann::json params = nlohmann::json::array();
    nlohmann::json params_data = nlohmann::json();
    params_data["fromBlock"] = utils::decimalToHex(fromBlock, true);
    params_data["toBlock"] = utils::decimalToHex(toBlock, true);
    params_data["address"] = address;
    params_data["topics"] = nlohmann::json::array({topic});
    params.push_back(params_data);

    auto cb = [user_cb=std::move(user_cb)](RpcResult<nlohmann::json> r) {
        if (!r)
        {
            user_cb(failed<std::vector<LogEntry>>(std::move(r.error)));
            return;
        }

        try
        {
            user_cb(RpcResult<std::vector<LogEntry>>{parseLogEntries(*r.value), {}});
        }
        catch (const std::exception& e)
        {
            log::warning(logcat, "Error parsing response from eth_getLogs: {}", e.what());
            user_cb(failed<std::vector<LogEntry>>({false, std::string{"unparseable eth_getLogs result: "} + e.what()}));
        }
    };
    makeJsonRpcRequest("eth_getLogs", params, std::move(cb));
}

std::vector<LogEntry> Provider::getEvents(uint64_t fromHeight, uint64_t toHeight, const EventSelector& selector) {
    return getLogs(fromHeight, toHeight, selector.contractAddress, selector.topic);
}

static RpcResult<uint64_t> parseHeightResponse(RpcResult<nlohmann::json> r)
{
    if (!r)
    {
        log::debug(logcat, "eth_blockNumber result empty");
        return failed<uint64_t>(std::move(r.error));
    }

    try
    {
        return RpcResult<uint64_t>{utils::hexStringToU64(r.value->get<std::string>()), {}};
    }
    catch (const std::exception& e)
    {
        log::warning(logcat, "Error parsing response from eth_blockNumber, input: {}", r.value->dump());
        return failed<uint64_t>({false, std::string{"unparseable eth_blockNumber result: "} + e.what()});
    }
}

uint64_t Provider::getLatestHeight() {
    JsonResultWaiter<uint64_t> waiter;
    getLatestHeightAsync(waiter.cb());
    return unwrap(waiter.get(), "Failed to get the latest height");
}

void Provider::getLatestHeightAsync(result_callback<uint64_t> user_cb)
{
    nlohmann::json params = nlohmann::json::array();

    auto cb = [user_cb=std::move(user_cb)](RpcResult<nlohmann::json> r) {
        user_cb(parseHeightResponse(std::move(r)));
    };

    makeJsonRpcRequest("eth_blockNumber", params, std::move(cb));
}

}; // namespace bridgewatch
