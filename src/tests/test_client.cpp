#include "http_client.hpp"
#include "memory_transport.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace reqlite;
using reqlite::testing::FakeConnector;
using reqlite::testing::FakeDns;
using reqlite::testing::Script;

namespace {

std::string drain(Response& response) {
    auto reader = response.body();
    assert(reader);
    auto body = reader->read_to_end();
    assert(body);
    return std::string(body->data(), body->size());
}

} // namespace

void test_request_handle() {
    auto script = std::make_shared<Script>();
    script->push("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello");
    FakeDns dns;
    FakeConnector connector(script);
    HttpClient client(dns, connector);

    auto handle = client.request(Method::Get, "http://example.com:8080/index?x=1");
    assert(handle);
    assert(dns.last_host == "example.com");
    assert(connector.last_port == 8080);
    assert(handle->connection().kind() == ConnectionKind::Plain);

    std::vector<char> rx(256);
    auto response = handle->send(rx);
    assert(response);
    assert(script->written == "GET /index?x=1 HTTP/1.1\r\nHost: example.com\r\n\r\n");
    assert(response->status() == 200);
    assert(drain(*response) == "hello");
    std::cout << "✓ Request handle carries method, path and host\n";
}

void test_send_twice_rejected() {
    auto script = std::make_shared<Script>();
    script->push("HTTP/1.1 204 No Content\r\n\r\n");
    FakeDns dns;
    FakeConnector connector(script);
    HttpClient client(dns, connector);

    auto handle = client.request(Method::Delete, "http://example.com/item/1");
    assert(handle);
    std::vector<char> rx(256);
    assert(handle->send(rx));

    std::string written = script->written;
    int writes = script->writes;
    auto again = handle->send(rx);
    assert(!again);
    assert(again.error().error == HttpError::AlreadySent);
    assert(script->written == written);
    assert(script->writes == writes);

    auto resource = client.resource("http://example.com/");
    assert(resource);
    script->push("HTTP/1.1 204 No Content\r\n\r\n");
    auto builder = resource->get("/x");
    assert(builder.send(rx));
    auto second = builder.send(rx);
    assert(!second && second.error().error == HttpError::AlreadySent);
    std::cout << "✓ Sending a consumed request fails with AlreadySent\n";
}

void test_scoped_resource() {
    auto script = std::make_shared<Script>();
    script->push("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n2\r\n[]\r\n0\r\n\r\n");
    script->push("HTTP/1.1 201 Created\r\nContent-Length: 0\r\n\r\n");
    script->push("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
    FakeDns dns;
    FakeConnector connector(script);
    HttpClient client(dns, connector);

    auto resource = client.resource("http://example.com/api");
    assert(resource);
    assert(resource->host() == "example.com");
    assert(resource->base_path() == "/api");
    std::vector<char> rx(256);

    auto users = resource->get("/users").send(rx);
    assert(users);
    assert(script->written == "GET /api/users HTTP/1.1\r\nHost: example.com\r\n\r\n");
    assert(drain(*users) == "[]");

    script->written.clear();
    BytesBody body(std::string_view("{\"name\":\"ada\"}"));
    auto created = resource->post("users").content_type(ContentType::ApplicationJson).body(body).send(rx);
    assert(created);
    assert(created->status() == 201);
    assert(script->written.starts_with("POST /api/users HTTP/1.1\r\nHost: example.com\r\n"
                                       "Content-Type: application/json\r\nContent-Length: 14\r\n\r\n"));

    script->written.clear();
    Request prepared = RequestBuilder(Method::Get, "/health").build();
    auto health = resource->send(prepared, rx);
    assert(health);
    assert(script->written == "GET /api/health HTTP/1.1\r\nHost: example.com\r\n\r\n");
    assert(drain(*health) == "ok");
    assert(connector.connects == 1);
    std::cout << "✓ Resource scope prefixes its base path over one connection\n";
}

void test_resource_path_override() {
    auto script = std::make_shared<Script>();
    script->push("HTTP/1.1 204 No Content\r\n\r\n");
    FakeDns dns;
    FakeConnector connector(script);
    HttpClient client(dns, connector);

    auto resource = client.resource("http://example.com/api");
    assert(resource);
    std::vector<char> rx(256);
    auto response = resource->get("/users").path("/v2/users?page=2").send(rx);
    assert(response);
    assert(response->status() == 204);
    assert(script->written == "GET /api/v2/users?page=2 HTTP/1.1\r\nHost: example.com\r\n\r\n");
    std::cout << "✓ Resource requests can replace their path\n";
}

void test_resource_requires_drained_body() {
    auto script = std::make_shared<Script>();
    script->push("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\ndata");
    FakeDns dns;
    FakeConnector connector(script);
    HttpClient client(dns, connector);

    auto resource = client.resource("http://example.com/");
    std::vector<char> rx(256);
    auto first = resource->get("/a").send(rx);
    assert(first);

    size_t written = script->written.size();
    auto second = resource->get("/b").send(rx);
    assert(!second);
    assert(second.error().error == HttpError::ConnectionNotReusable);
    assert(script->written.size() == written);
    std::cout << "✓ Resource refuses a request while the previous body is unread\n";
}

void test_buffered_handle() {
    auto script = std::make_shared<Script>();
    script->push("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
    FakeDns dns;
    FakeConnector connector(script);
    HttpClient client(dns, connector);

    std::vector<char> tx(256);
    auto handle = client.request(Method::Get, "http://example.com/a");
    assert(handle);
    auto buffered = std::move(*handle).into_buffered(tx);
    assert(buffered.connection().kind() == ConnectionKind::PlainBuffered);

    Header headers[] = {{"Accept", "*/*"}, {"X-Id", "7"}};
    std::vector<char> rx(256);
    assert(buffered.headers(headers).send(rx));
    assert(script->writes == 1);
    assert(script->written == "GET /a HTTP/1.1\r\nHost: example.com\r\nAccept: */*\r\nX-Id: 7\r\n\r\n");
    std::cout << "✓ Buffered request handle writes once\n";
}

void test_setup_failures() {
    auto script = std::make_shared<Script>();
    FakeDns dns;
    FakeConnector connector(script);
    HttpClient client(dns, connector);

    auto secure = client.request(Method::Get, "https://example.com/");
    assert(!secure);
    assert(secure.error().error == HttpError::UnsupportedScheme);
    assert(secure.error().retry_safe());
    assert(dns.lookups == 0);
    assert(connector.connects == 0);

    auto invalid = client.resource("not a url");
    assert(!invalid);
    assert(invalid.error().error == HttpError::InvalidUrl);
    assert(dns.lookups == 0);

    auto other = client.request(Method::Get, "ftp://example.com/");
    assert(!other && other.error().error == HttpError::UnsupportedScheme);

    dns.fail = true;
    auto unresolved = client.request(Method::Get, "http://nowhere.invalid/");
    assert(!unresolved);
    assert(unresolved.error().error == HttpError::Dns);
    assert(unresolved.error().transport == TransportError::DnsError);
    assert(unresolved.error().retry_safe());
    assert(connector.connects == 0);

    dns.fail = false;
    connector.fail = true;
    auto refused = client.resource("http://example.com/");
    assert(!refused);
    assert(refused.error().error == HttpError::Network);
    assert(refused.error().transport == TransportError::ConnectionFailed);
    assert(refused.error().retry_safe());
    std::cout << "✓ Setup failures are classified and retry-safe\n";
}

void test_wire_failure_not_retry_safe() {
    auto script = std::make_shared<Script>();
    script->push("HTTP/1.1 200 OK\r\nContent-Le");
    FakeDns dns;
    FakeConnector connector(script);
    HttpClient client(dns, connector);

    auto handle = client.request(Method::Get, "http://example.com/");
    std::vector<char> rx(256);
    auto response = handle->send(rx);
    assert(!response);
    assert(response.error().connection_poisoned);
    assert(!response.error().retry_safe());
    assert(handle->connection().state() == ConnectionState::Poisoned);
    std::cout << "✓ Failures after the request was written poison the connection\n";
}

int main() {
    try {
        test_request_handle();
        test_send_twice_rejected();
        test_scoped_resource();
        test_resource_path_override();
        test_resource_requires_drained_body();
        test_buffered_handle();
        test_setup_failures();
        test_wire_failure_not_retry_safe();
        std::cout << "\n✓ All client tests passed\n";
    } catch (const std::exception& e) {
        std::cerr << "✗ " << e.what() << "\n";
        return 1;
    }
    return 0;
}
