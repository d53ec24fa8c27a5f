/// @file rpc_client_example.cpp
/// @brief XML-RPC Client Example
///
/// This example demonstrates how to use Rivet's XML-RPC client against the
/// rpc_server_example. It makes direct calls through namespace proxies,
/// batches several calls into one system.multiCall round trip and shows
/// how faults and transport errors surface.
///
/// Usage: ./rpc_client_example [url]
/// Default: http://127.0.0.1:9000/

#include <rivet/rivet.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace rivet;

// ============================================================================
// Helper functions
// ============================================================================

void print_user(const rpc::value& user) {
    std::cout << "  ID: " << user["id"].as_int() << std::endl;
    std::cout << "  Name: " << user["name"].as_string() << std::endl;
    std::cout << "  Email: " << user["email"].as_string() << std::endl;
    std::cout << "  Roles: " << user["roles"].dump() << std::endl;
    if (const auto* created = user.find("created")) {
        std::cout << "  Created: " << created->as_datetime().iso8601() << std::endl;
    }
}

bool report_fault(const char* what, const rpc::value& result) {
    auto f = rpc::fault::from_value(result);
    if (!f) return false;
    std::cerr << what << " failed: " << f->message << " (" << f->code << ")" << std::endl;
    return true;
}

// ============================================================================
// Client demo
// ============================================================================

void run_demo(rpc::client& client) {
    std::cout << "\n=== Rivet XML-RPC Client Demo ===" << std::endl;

    // Test 1: Echo
    std::cout << "\n--- Test 1: Echo ---" << std::endl;
    {
        auto result = client.call("echo", "Hello, RPC!", 3).get();
        if (!report_fault("Echo", result)) {
            std::cout << "Echo response (" << result.size() << " messages):" << std::endl;
            for (const auto& msg : result.as_array()) {
                std::cout << "  - " << msg.as_string() << std::endl;
            }
        }
    }

    // Test 2: Create users
    std::cout << "\n--- Test 2: Create Users ---" << std::endl;
    std::vector<int64_t> created_ids;
    {
        struct new_user {
            const char* name;
            const char* email;
            std::vector<std::string> roles;
        };
        std::vector<new_user> requests = {
            {"Alice", "alice@example.com", {"admin", "user"}},
            {"Bob", "bob@example.com", {"user"}},
            {"Charlie", "charlie@example.com", {"user", "developer"}},
        };

        auto& users = client["users"];
        for (const auto& req : requests) {
            auto result = users.call("create", req.name, req.email, rpc::to_value(req.roles)).get();
            if (!report_fault("CreateUser", result)) {
                std::cout << "Created user '" << req.name << "' with ID " << result.as_int()
                          << std::endl;
                created_ids.push_back(result.as_int());
            }
        }
    }

    // Test 3: Get user
    std::cout << "\n--- Test 3: Get User ---" << std::endl;
    if (!created_ids.empty()) {
        auto result = client["users"].call("get", created_ids[0]).get();
        if (result.is_nil()) {
            std::cout << "User not found" << std::endl;
        } else if (!report_fault("GetUser", result)) {
            std::cout << "Found user:" << std::endl;
            print_user(result);
        }
    }

    // Test 4: Batch - list users and run every calculation in one round trip
    std::cout << "\n--- Test 4: Batch ---" << std::endl;
    {
        std::vector<std::pair<std::string, std::vector<double>>> calcs = {
            {"add", {10, 20, 30}},
            {"subtract", {100, 25, 10}},
            {"multiply", {2, 3, 4}},
            {"divide", {100, 2, 5}},
            {"divide", {1, 0}},
        };

        rpc::value listing;
        std::vector<rpc::value> answers(calcs.size());

        // Accessing "system" opens the batch; calls until multiCall are deferred
        auto& system = client["system"];
        std::vector<rpc::argument> batch;
        batch.emplace_back(client["users"].call("list", 0, 10).bind(listing));
        for (size_t i = 0; i < calcs.size(); ++i) {
            batch.emplace_back(client["math"].call("calculate", calcs[i].first,
                                                   rpc::to_value(calcs[i].second))
                                   .bind(answers[i]));
        }
        auto results = system.invoke("multiCall", std::move(batch)).get();

        if (!report_fault("Batch", results)) {
            std::cout << "Users:" << std::endl;
            for (const auto& user : listing.as_array()) {
                std::cout << "  [" << user["id"].as_int() << "] " << user["name"].as_string()
                          << " <" << user["email"].as_string() << ">" << std::endl;
            }
            for (size_t i = 0; i < calcs.size(); ++i) {
                std::cout << calcs[i].first << rpc::to_value(calcs[i].second).dump() << " = ";
                if (rpc::is_fault(answers[i])) {
                    std::cout << "fault: " << answers[i]["faultString"].as_string() << std::endl;
                } else {
                    std::cout << answers[i].as_double() << std::endl;
                }
            }
        }
    }

    // Test 5: Introspection
    std::cout << "\n--- Test 5: Introspection ---" << std::endl;
    {
        auto names = client["system"].call("listMethods").get();
        if (!report_fault("listMethods", names)) {
            for (const auto& name : names.as_array()) {
                auto help = client["system"].call("methodHelp", name).get();
                std::cout << "  " << name.as_string() << ": "
                          << (help.is_string() ? help.as_string() : help.dump()) << std::endl;
            }
        }
    }

    // Test 6: Error handling - unknown method
    std::cout << "\n--- Test 6: Unknown Method ---" << std::endl;
    {
        auto result = client.call("noSuchOp").get();
        report_fault("noSuchOp", result);
    }

    // Test 7: Error handling - faults raised as exceptions
    std::cout << "\n--- Test 7: Throwing Client ---" << std::endl;
    {
        rpc::client strict(client.url(), {.throw_on_fault = true});
        try {
            strict["math"].call("calculate", "modulo", rpc::value::array{7, 2});
            std::cout << "Unexpected success" << std::endl;
        } catch (const rpc::remote_fault& e) {
            std::cout << "Caught remote fault " << e.code() << ": " << e.what() << std::endl;
        }
    }

    std::cout << "\n=== Demo Complete ===" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string url = "http://127.0.0.1:9000/";
    if (argc > 1) {
        url = argv[1];
    }

    std::cout << "Connecting to " << url << "..." << std::endl;

    try {
        rpc::client client(url);
        run_demo(client);
    } catch (const rpc::transport_error& e) {
        std::cerr << e.what() << ": " << e.detail() << std::endl;
        return 1;
    } catch (const rpc::error& e) {
        std::cerr << "RPC error " << e.code() << ": " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
