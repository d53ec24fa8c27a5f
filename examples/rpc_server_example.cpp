/// @file rpc_server_example.cpp
/// @brief XML-RPC Server Example
///
/// This example demonstrates how to publish procedures with Rivet's XML-RPC
/// server. It registers a user store as the "users" service, a calculator
/// as the "math" service and a top-level echo method, then serves them
/// over HTTP. Browse to the endpoint for the generated documentation.
///
/// Usage: ./rpc_server_example [port] [log-level]
/// Default port: 9000

#include <rivet/rivet.hpp>

#include <fmt/ranges.h>

#include <csignal>
#include <ctime>
#include <map>
#include <mutex>
#include <pthread.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace rivet;

// ============================================================================
// Service implementations
// ============================================================================

// In-memory user store
class user_store {
public:
    /// Returns the user struct, or nil when the id is unknown
    rpc::value get_user(int64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(id);
        if (it == users_.end()) {
            return rpc::value{};
        }
        return it->second;
    }

    int64_t create_user(const std::string& name, const std::string& email,
                        std::vector<std::string> roles) {
        if (name.empty()) {
            throw rpc::invalid_argument(rpc::error_code::invalid_params, "Name is required");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t id = next_id_++;
        users_[id] = rpc::value::structure{
            {"id", id},
            {"name", name},
            {"email", email},
            {"roles", rpc::to_value(roles)},
            {"created", rpc::make_datetime(std::time(nullptr))},
        };
        RIVET_LOG_INFO("Created user {} with ID {}", name, id);
        return id;
    }

    rpc::value list_users(int64_t offset, int64_t limit) {
        std::lock_guard<std::mutex> lock(mutex_);
        rpc::value::array result;
        int64_t count = 0;
        for (const auto& [id, user] : users_) {
            if (count >= offset && static_cast<int64_t>(result.size()) < limit) {
                result.push_back(user);
            }
            ++count;
        }
        return result;
    }

private:
    std::mutex mutex_;
    std::map<int64_t, rpc::value> users_;
    int64_t next_id_ = 1;
};

double calculate(const std::string& operation, const std::vector<double>& operands) {
    if (operands.empty()) {
        throw rpc::invalid_argument(rpc::error_code::invalid_params, "No operands provided");
    }

    double result = operands[0];
    for (size_t i = 1; i < operands.size(); ++i) {
        if (operation == "add") {
            result += operands[i];
        } else if (operation == "subtract") {
            result -= operands[i];
        } else if (operation == "multiply") {
            result *= operands[i];
        } else if (operation == "divide") {
            if (operands[i] == 0) {
                throw std::domain_error("Division by zero");
            }
            result /= operands[i];
        } else {
            throw rpc::invalid_argument(rpc::error_code::invalid_params,
                                        "Unknown operation: " + operation);
        }
    }
    return result;
}

int main(int argc, char* argv[]) {
    uint16_t port = 9000;
    if (argc > 1) {
        port = static_cast<uint16_t>(std::stoi(argv[1]));
    }
    if (argc > 2) {
        auto lvl = log::level_from_string(argv[2]);
        if (!lvl) {
            RIVET_LOG_ERROR("Unknown log level: {}", argv[2]);
            return 1;
        }
        log::logger::instance().set_level(*lvl);
    }

    // Block signals BEFORE creating any threads so only the waiter sees them
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    user_store store;

    rpc::service users;
    users.add("get", &store, &user_store::get_user,
              "Look up a user by id; nil when unknown", {"struct", "int"});
    users.add("create", &store, &user_store::create_user,
              "Create a user and return its id", {"int", "string", "string", "array"});
    users.add("list", &store, &user_store::list_users,
              "Page through the users", {"array", "int", "int"});

    rpc::service math;
    math.add("calculate", &calculate,
             "Fold the operands with add, subtract, multiply or divide",
             {"double", "string", "array"});

    rpc::server_options options;
    options.name = "Rivet example server";
    options.root = fmt::format("http://127.0.0.1:{}/", port);
    rpc::server server(options);
    server.add_services({{"users", users}, {"math", math}});
    server.add_method("echo", [](const std::string& message, int64_t repeat) {
        rpc::value::array out;
        for (int64_t i = 0; i < repeat; ++i) {
            out.emplace_back(message);
        }
        return out;
    }, "Repeat a message", {"array", "string", "int"});

    http::rpc_http_server front(server, {.port = port});
    if (!front.bind()) {
        return 1;
    }

    std::thread waiter([&front, &sigs] {
        int sig = 0;
        if (sigwait(&sigs, &sig) == 0) {
            RIVET_LOG_INFO("Received signal {} - initiating shutdown", sig);
        }
        front.stop();
    });

    RIVET_LOG_INFO("Available methods: {}", fmt::join(server.method_names(), ", "));
    RIVET_LOG_INFO("Press Ctrl+C to stop");

    front.serve();
    waiter.join();

    RIVET_LOG_INFO("Server stopped");
    return 0;
}
