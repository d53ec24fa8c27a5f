#include <catch2/catch_test_macros.hpp>
#include <rivet/rpc/rpc_client.hpp>
#include <rivet/rpc/rpc_server.hpp>
#include <rivet/rpc/xmlrpc_codec.hpp>

#include "../test_main.cpp"  // For in-process transports

#include <memory>
#include <stdexcept>
#include <string>

using namespace rivet::rpc;
using rivet::test::loopback_transport;
using rivet::test::recording_transport;

namespace {

constexpr const char* endpoint = "http://rpc.test/RPC2";

size_t count_of(const std::string& text, const std::string& needle) {
    size_t n = 0;
    for (auto pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

// Client wired to an in-process server
struct loopback_fixture {
    server srv;
    std::shared_ptr<loopback_transport> transport;
    client rpc;
    int counted = 0;

    explicit loopback_fixture(client_options options = {})
        : transport(std::make_shared<loopback_transport>(srv))
        , rpc(endpoint, with_transport(std::move(options), transport)) {
        srv.add_method("echo", [](const params& args) {
            return args.empty() ? value() : args[0];
        });
        srv.add_method("add", [](int64_t a, int64_t b) { return a + b; });
        srv.add_method("blob", [] { return make_binary(std::string("\x00\x01", 2)); });
        srv.add_method("when", [] { return make_datetime(900684535); });
        srv.add_method("count", [this] { ++counted; });

        service files;
        files.add("size", [](const std::string& path) { return static_cast<int64_t>(path.size()); });
        srv.add_service(files, "files");
    }

    static client_options with_transport(client_options options,
                                         std::shared_ptr<loopback_transport> t) {
        options.transport = std::move(t);
        return options;
    }
};

client recording_client(std::shared_ptr<recording_transport> t, client_options options = {}) {
    options.transport = std::move(t);
    return client(endpoint, std::move(options));
}

// Encodes like XML-RPC but answers every response with a fixed value
class canned_codec : public xmlrpc_codec {
public:
    explicit canned_codec(value answer) : answer_(std::move(answer)) {}

    value decode_response(std::string_view /*payload*/) const override { return answer_; }

private:
    value answer_;
};

// Fails the first post, then forwards to another transport
class failing_once_transport : public transport {
public:
    explicit failing_once_transport(std::shared_ptr<transport> next) : next_(std::move(next)) {}

    std::string post(std::string_view url, std::string_view request,
                     std::string_view content_type) override {
        if (++attempts == 1) {
            throw transport_error("Connection refused", "connect() failed", 111);
        }
        return next_->post(url, request, content_type);
    }

    int attempts = 0;

private:
    std::shared_ptr<transport> next_;
};

} // namespace

// ============================================================================
// Namespace tree
// ============================================================================

TEST_CASE("Namespace nodes are cached and qualified", "[rpc][client]") {
    auto t = std::make_shared<recording_transport>();
    auto c = recording_client(t);

    REQUIRE(c.path().empty());
    REQUIRE(c.url() == endpoint);
    REQUIRE(&c["files"] == &c["files"]);
    REQUIRE(&c.child("a").child("b") == &c["a"]["b"]);
    REQUIRE(c["a"]["b"].path() == "a.b");
    REQUIRE(&c["a"].session() == &c.session());
}

TEST_CASE("Calls are sent with the qualified method name", "[rpc][client]") {
    auto t = std::make_shared<recording_transport>();
    auto c = recording_client(t);

    auto r = c["a"]["b"].call("op", 1, "two");
    REQUIRE_FALSE(r.deferred());
    REQUIRE(r.get() == value("ok"));

    REQUIRE(t->requests.size() == 1);
    REQUIRE(t->urls[0] == endpoint);
    REQUIRE(t->content_types[0] == "text/xml");
    REQUIRE(t->requests[0].find("<methodName>a.b.op</methodName>") != std::string::npos);
    REQUIRE(t->requests[0].find("<string>two</string>") != std::string::npos);
}

TEST_CASE("Client request encoding follows the output options", "[rpc][client]") {
    auto t = std::make_shared<recording_transport>();
    client_options opts;
    opts.output.layout = verbosity::no_white_space;
    auto c = recording_client(t, opts);

    c.call("ping");
    REQUIRE(t->requests[0].starts_with("<?xml version=\"1.0\""));
    REQUIRE(t->requests[0].find('\n') == std::string::npos);
    REQUIRE(t->requests[0].find("<methodCall><methodName>ping</methodName>") != std::string::npos);
}

TEST_CASE("Client rejects an unsupported dialect", "[rpc][client]") {
    client_options opts;
    opts.output.version = dialect::soap_1_1;
    opts.transport = std::make_shared<recording_transport>();
    REQUIRE_THROWS_AS(client(endpoint, opts), configuration_error);
}

// ============================================================================
// Direct calls
// ============================================================================

TEST_CASE("Direct calls return the decoded result", "[rpc][client]") {
    loopback_fixture fx;

    REQUIRE(fx.rpc.call("add", 2, 3).get() == value(5));
    REQUIRE(fx.rpc["files"].call("size", "README").get() == value(6));
    REQUIRE(fx.transport->posts == 2);
    REQUIRE(fx.transport->last_url == endpoint);

    value bound;
    fx.rpc.call("echo", "hi").bind(bound);
    REQUIRE(bound == value("hi"));
}

TEST_CASE("Direct calls do not decode base64 and dateTime", "[rpc][client]") {
    loopback_fixture fx;

    REQUIRE(fx.rpc.call("blob").get().is_binary());
    REQUIRE(fx.rpc.call("when").get().is_datetime());
}

TEST_CASE("Fault responses are returned as values by default", "[rpc][client]") {
    loopback_fixture fx;

    auto result = fx.rpc.call("noSuchOp").get();
    REQUIRE(is_fault(result));
    REQUIRE(result["faultCode"].as_int() == -1);
    REQUIRE(result["faultString"].as_string() == "Procedure noSuchOp not found.");
}

TEST_CASE("Fault responses throw when configured", "[rpc][client]") {
    client_options opts;
    opts.throw_on_fault = true;
    loopback_fixture fx(opts);

    try {
        fx.rpc.call("noSuchOp");
        FAIL("fault must throw");
    } catch (const remote_fault& e) {
        REQUIRE(e.code() == -1);
        REQUIRE(std::string(e.what()) == "Procedure noSuchOp not found.");
    }
    REQUIRE(fx.rpc.call("add", 1, 1).get() == value(2));
}

TEST_CASE("Call arguments are rejected outside a batch", "[rpc][client]") {
    loopback_fixture fx;

    try {
        fx.rpc.call("echo", encode_call("add", {1, 2}));
        FAIL("descriptor argument must throw");
    } catch (const invalid_argument& e) {
        REQUIRE(e.code() == to_int(error_code::invalid_batch_argument));
    }
    REQUIRE(fx.transport->posts == 0);
}

TEST_CASE("Last request and response are kept", "[rpc][client]") {
    loopback_fixture fx;
    REQUIRE(fx.rpc.last_request().empty());

    fx.rpc.call("add", 2, 3);
    REQUIRE(fx.rpc.last_request().find("<methodName>add</methodName>") != std::string::npos);
    REQUIRE(fx.rpc.last_response().find("<i4>5</i4>") != std::string::npos);
    REQUIRE(fx.rpc["files"].last_request() == fx.rpc.last_request());
}

// ============================================================================
// Batches
// ============================================================================

TEST_CASE("Batch sends one request and binds results", "[rpc][client][batch]") {
    loopback_fixture fx;
    value title, size;

    auto results = fx.rpc["system"].call("multiCall",
        fx.rpc.call("echo", "hi").bind(title),
        fx.rpc["files"].call("size", "README").bind(size)).get();

    REQUIRE(fx.transport->posts == 1);
    REQUIRE(fx.rpc.batch_depth() == 0);
    REQUIRE(results == value(value::array{"hi", 6}));
    REQUIRE(title == value("hi"));
    REQUIRE(size == value(6));
    REQUIRE(fx.rpc.last_request().find("<methodName>system.multiCall</methodName>") !=
            std::string::npos);
}

TEST_CASE("Calls inside a batch scope are deferred", "[rpc][client][batch]") {
    loopback_fixture fx;

    auto& sys = fx.rpc["system"];
    REQUIRE(fx.rpc.batch_depth() == 1);

    auto r = fx.rpc.call("echo", 1);
    REQUIRE(r.deferred());
    REQUIRE_THROWS_AS(r.get(), invalid_argument);
    REQUIRE(fx.transport->posts == 0);

    auto c = r.descriptor();
    REQUIRE(c->method() == "echo");
    REQUIRE(c->args() == params{1});
    REQUIRE_FALSE(c->enrolled());
    REQUIRE_FALSE(c->completed());

    auto results = sys.call("multiCall", r).get();
    REQUIRE(results == value(value::array{1}));
    REQUIRE(c->enrolled());
    REQUIRE(c->completed());
    REQUIRE(c->index() == 0u);
    REQUIRE(*c->result() == value(1));
    REQUIRE(fx.rpc.batch_depth() == 0);
}

TEST_CASE("System calls outside a batch are sent directly", "[rpc][client][batch]") {
    loopback_fixture fx;

    auto names = fx.rpc["system"].call("listMethods").get();
    REQUIRE(fx.rpc.batch_depth() == 0);
    REQUIRE(fx.transport->posts == 1);
    REQUIRE(names.is_array());
    REQUIRE(names[0] == value("add"));

    bool found = false;
    for (const auto& n : names.as_array()) {
        if (n == value("files.size")) found = true;
    }
    REQUIRE(found);

    // The scope closed, so ordinary calls go out again
    REQUIRE(fx.rpc.call("add", 1, 2).get() == value(3));
}

TEST_CASE("System calls nested in a batch are deferred", "[rpc][client][batch]") {
    loopback_fixture fx;

    auto results = fx.rpc["system"].call("multiCall",
        fx.rpc["system"].call("methodHelp", "add"),
        fx.rpc.call("echo", 1)).get();

    REQUIRE(fx.transport->posts == 1);
    REQUIRE(fx.rpc.batch_depth() == 0);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0] == value(""));
    REQUIRE(results[1] == value(1));
}

TEST_CASE("Batch results keep per-entry faults", "[rpc][client][batch]") {
    client_options opts;
    opts.throw_on_fault = true;
    loopback_fixture fx(opts);

    auto results = fx.rpc["system"].call("multiCall",
        fx.rpc.call("echo", 1),
        fx.rpc.call("noSuchOp")).get();

    REQUIRE(results.size() == 2);
    REQUIRE(results[0] == value(1));
    REQUIRE(is_fault(results[1]));
    REQUIRE(results[1]["faultCode"].as_int() == -1);
}

TEST_CASE("Batch results decode base64 and dateTime", "[rpc][client][batch]") {
    SECTION("auto decode on") {
        loopback_fixture fx;
        auto results = fx.rpc["system"].call("multiCall",
            fx.rpc.call("blob"), fx.rpc.call("when")).get();

        REQUIRE(results[0] == value(std::string("\x00\x01", 2)));
        REQUIRE(results[1] == value(900684535));
    }

    SECTION("auto decode off") {
        client_options opts;
        opts.auto_decode = false;
        loopback_fixture fx(opts);
        auto results = fx.rpc["system"].call("multiCall",
            fx.rpc.call("blob"), fx.rpc.call("when")).get();

        REQUIRE(results[0].is_binary());
        REQUIRE(results[1].is_datetime());
    }
}

TEST_CASE("A descriptor listed twice is sent once", "[rpc][client][batch]") {
    loopback_fixture fx;
    value seen;

    auto& sys = fx.rpc["system"];
    auto r = fx.rpc.call("echo", "twice");
    r.bind(seen);
    auto results = sys.call("multiCall", r, r).get();

    REQUIRE(results == value(value::array{"twice", "twice"}));
    REQUIRE(count_of(fx.rpc.last_request(), "<string>echo</string>") == 1);
    REQUIRE(seen == value("twice"));
}

TEST_CASE("A descriptor cannot join a second batch", "[rpc][client][batch]") {
    loopback_fixture fx;

    auto& sys = fx.rpc["system"];
    auto r = fx.rpc.call("echo", 1);
    sys.call("multiCall", r);
    REQUIRE(fx.transport->posts == 1);

    try {
        fx.rpc.multi_call({r.descriptor()});
        FAIL("reused descriptor must throw");
    } catch (const invalid_argument& e) {
        REQUIRE(e.code() == to_int(error_code::invalid_batch_argument));
        REQUIRE(std::string(e.what()) == "Argument 0 (echo) belongs to an earlier batch");
    }
    REQUIRE(fx.transport->posts == 1);
}

TEST_CASE("Batch rejects arguments that are not calls", "[rpc][client][batch]") {
    loopback_fixture fx;

    SECTION("plain value") {
        try {
            fx.rpc["system"].call("multiCall", fx.rpc.call("echo", 1), 42);
            FAIL("plain value must throw");
        } catch (const invalid_argument& e) {
            REQUIRE(e.code() == to_int(error_code::invalid_batch_argument));
            REQUIRE(std::string(e.what()) == "Argument 1 is not a valid call");
        }
    }

    SECTION("struct without methodName") {
        REQUIRE_THROWS_AS(
            fx.rpc["system"].call("multiCall", value(value::structure{{"params", 1}})),
            invalid_argument);
    }

    SECTION("null descriptor") {
        REQUIRE_THROWS_AS(fx.rpc.multi_call({call_ptr{}}), invalid_argument);
    }

    REQUIRE(fx.transport->posts == 0);
    REQUIRE(fx.rpc.batch_depth() == 0);
}

TEST_CASE("Batch accepts hand-built entries", "[rpc][client][batch]") {
    loopback_fixture fx;

    SECTION("struct arguments") {
        auto results = fx.rpc["system"].call("multiCall",
            value(value::structure{{"methodName", "add"}, {"params", value::array{2, 2}}}),
            value(value::structure{{"methodName", "echo"}, {"params", "solo"}})).get();
        REQUIRE(results == value(value::array{4, "solo"}));
    }

    SECTION("single array of entries") {
        value list = value::array{
            value::structure{{"methodName", "echo"}, {"params", value::array{"a"}}},
            value::structure{{"methodName", "echo"}, {"params", value::array{"b"}}},
        };
        auto results = fx.rpc["system"].call("multiCall", list).get();
        REQUIRE(results == value(value::array{"a", "b"}));
    }

    SECTION("encoded descriptors") {
        auto a = encode_call("add", {1, 2});
        auto b = encode_call("files.size", {"abc"});
        auto results = fx.rpc.multi_call({a, b});
        REQUIRE(results == value(value::array{3, 3}));
        REQUIRE(*a->result() == value(3));
        REQUIRE(b->index() == 1u);
    }

    REQUIRE(fx.transport->posts == 1);
}

TEST_CASE("Nested multiCall fails the whole batch", "[rpc][client][batch]") {
    loopback_fixture fx;

    auto result = fx.rpc.multi_call({
        encode_call("count"),
        encode_call("system.multiCall", {value::array{}}),
    });

    REQUIRE(is_fault(result));
    REQUIRE(result["faultCode"].as_int() == to_int(error_code::recursive_batch));
    REQUIRE(fx.counted == 0);
}

TEST_CASE("Batch response with the wrong size is rejected", "[rpc][client][batch]") {
    auto t = std::make_shared<recording_transport>();
    t->response = xmlrpc_codec().encode_response(value::array{value::array{1}});
    auto c = recording_client(t);

    try {
        c.multi_call({encode_call("a"), encode_call("b")});
        FAIL("short response must throw");
    } catch (const parse_error& e) {
        REQUIRE(std::string(e.what()) == "Batch response has 1 entries, expected 2");
    }
}

TEST_CASE("Batch entries carry methodName and params", "[rpc][client][batch]") {
    auto t = std::make_shared<recording_transport>();
    t->responder = [](std::string_view) {
        return xmlrpc_codec().encode_response(value::array{value::array{"x"}});
    };
    client_options opts;
    opts.output.layout = verbosity::no_white_space;
    auto c = recording_client(t, opts);

    c.multi_call({encode_call("ns.op", {7})});
    REQUIRE(t->requests.size() == 1);

    auto sent = xmlrpc_codec().decode_request(t->requests[0]);
    REQUIRE(sent.name == "system.multiCall");
    REQUIRE(sent.args.size() == 1);
    REQUIRE(sent.args[0] == value(value::array{
                                value::structure{{"methodName", "ns.op"}, {"params", value::array{7}}},
                            }));
}

TEST_CASE("Unreadable dateTime in a batch stays as received", "[rpc][client][batch]") {
    auto t = std::make_shared<recording_transport>();
    client_options opts;
    opts.codec = std::make_shared<canned_codec>(value::array{
        value::array{1},
        value::array{datetime("20240101T12:00:00+02:00")},
        value::array{datetime("19980717T14:08:55")},
    });
    auto c = recording_client(t, opts);

    value first, offset, plain;
    auto& sys = c["system"];
    auto a = c.call("a").bind(first);
    auto b = c.call("b").bind(offset);
    auto d = c.call("d").bind(plain);

    value results;
    REQUIRE_NOTHROW(results = sys.call("multiCall", a, b, d).get());
    REQUIRE(first == value(1));
    REQUIRE(offset.is_datetime());
    REQUIRE(offset.as_datetime().iso8601() == "20240101T12:00:00+02:00");
    REQUIRE(plain == value(900684535));
    REQUIRE(results[1] == offset);
    REQUIRE(b.descriptor()->completed());
}

TEST_CASE("A batch can be retried after a transport failure", "[rpc][client][batch]") {
    loopback_fixture fx;
    auto flaky = std::make_shared<failing_once_transport>(fx.transport);
    client c(endpoint, {.transport = flaky});

    auto a = encode_call("add", {1, 2});
    auto b = encode_call("echo", {"x"});

    REQUIRE_THROWS_AS(c.multi_call({a, b}), transport_error);
    REQUIRE_FALSE(a->enrolled());
    REQUIRE_FALSE(b->completed());

    auto results = c.multi_call({a, b});
    REQUIRE(results == value(value::array{3, "x"}));
    REQUIRE(a->enrolled());
    REQUIRE(*b->result() == value("x"));
    REQUIRE(flaky->attempts == 2);
    REQUIRE(fx.transport->posts == 1);
}
