#include "http_client.hpp"
#include "socket_wrapper.hpp"
#include "compact_log.hpp"
#include <charconv>
#include <iostream>
#include <string>
#include <vector>

using namespace reqlite;

enum class FSMState {
    Init,
    ParseArgs,
    Connect,
    Send,
    ReadBody,
    Error,
    Done
};

struct CliConfig {
    int timeout_sec = 30;
    size_t rx_buffer = 16 * 1024;
    size_t tx_buffer = 4 * 1024;
    size_t tls_buffer = 16 * 1024 + 256;
    uint64_t seed = 0x5eed;
    bool buffered = false;
    bool chunked = false;
    bool insecure = false;
};

struct FSMContext {
    int argc;
    char** argv;
    CliConfig config;
    Method method = Method::Get;
    std::string url;
    std::optional<std::string> scoped_path;
    std::vector<std::string> raw_headers;
    std::vector<Header> headers;
    std::optional<std::string> data;
    std::optional<ContentType> content_type;
    std::optional<std::string> user;
    std::optional<std::string> psk;
    std::vector<uint8_t> psk_key;
    std::string psk_identity;
    int exit_code = 0;
    std::string error_message;
};

void print_usage(const char* program_name) {
    std::cerr << "HTTP/1.1 client (C++23)\n\n"
              << "Usage: " << program_name << " <method> <url> [options]\n\n"
              << "Options:\n"
              << "  --header \"Name: Value\"       Add a request header (repeatable)\n"
              << "  --data <text>                Request body\n"
              << "  --chunked                    Send the body with chunked transfer coding\n"
              << "  --content-type <mime>        Content-Type of the body\n"
              << "  --user <user:password>       Basic authentication\n"
              << "  --buffered                   Coalesce writes on plain connections\n"
              << "  --psk <identity:hexkey>      TLS pre-shared key\n"
              << "  --insecure                   TLS without peer verification\n"
              << "  --seed <n>                   TLS random seed\n"
              << "  --timeout <seconds>          Socket timeout\n"
              << "  --rx-buffer <bytes>          Receive buffer size\n"
              << "  --path <p>                   Send through a resource scope rooted at <url>\n\n"
              << "Environment:\n"
              << "  REQLITE_LOG=error|warn|info|debug|trace\n";
}

std::optional<Method> parse_method(std::string_view text) {
    for (auto m : {Method::Get, Method::Post, Method::Put, Method::Delete, Method::Head,
                   Method::Options, Method::Connect, Method::Trace, Method::Patch}) {
        if (iequals(text, to_string(m))) return m;
    }
    return std::nullopt;
}

template<typename T>
bool parse_number(std::string_view text, T& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

bool parse_hex(std::string_view text, std::vector<uint8_t>& out) {
    if (text.empty() || text.size() % 2 != 0) return false;
    out.clear();
    for (size_t i = 0; i < text.size(); i += 2) {
        uint8_t byte = 0;
        auto [ptr, ec] = std::from_chars(text.data() + i, text.data() + i + 2, byte, 16);
        if (ec != std::errc() || ptr != text.data() + i + 2) return false;
        out.push_back(byte);
    }
    return true;
}

bool parse_options(FSMContext& ctx) {
    auto fail = [&](std::string msg) {
        ctx.error_message = std::move(msg);
        return false;
    };

    for (int i = 3; i < ctx.argc; ++i) {
        std::string_view a = ctx.argv[i];
        bool has_value = i + 1 < ctx.argc;
        if (a == "--header" && has_value) ctx.raw_headers.emplace_back(ctx.argv[++i]);
        else if (a == "--data" && has_value) ctx.data = ctx.argv[++i];
        else if (a == "--chunked") ctx.config.chunked = true;
        else if (a == "--content-type" && has_value) {
            std::string_view mime = ctx.argv[++i];
            ctx.content_type = content_type_from_str(mime);
            if (!ctx.content_type) return fail("Unknown content type: " + std::string(mime));
        }
        else if (a == "--user" && has_value) ctx.user = ctx.argv[++i];
        else if (a == "--buffered") ctx.config.buffered = true;
        else if (a == "--psk" && has_value) ctx.psk = ctx.argv[++i];
        else if (a == "--insecure") ctx.config.insecure = true;
        else if (a == "--seed" && has_value) {
            if (!parse_number(std::string_view(ctx.argv[++i]), ctx.config.seed)) return fail("Invalid --seed");
        }
        else if (a == "--timeout" && has_value) {
            if (!parse_number(std::string_view(ctx.argv[++i]), ctx.config.timeout_sec)) return fail("Invalid --timeout");
        }
        else if (a == "--rx-buffer" && has_value) {
            if (!parse_number(std::string_view(ctx.argv[++i]), ctx.config.rx_buffer) || ctx.config.rx_buffer == 0) {
                return fail("Invalid --rx-buffer");
            }
        }
        else if (a == "--path" && has_value) ctx.scoped_path = ctx.argv[++i];
        else return fail("Unknown option: " + std::string(a));
    }

    // Views into raw_headers; the vector is not touched again.
    for (const auto& line : ctx.raw_headers) {
        std::string_view text = line;
        size_t colon = text.find(':');
        if (colon == std::string_view::npos || colon == 0) return fail("Invalid header: " + line);
        ctx.headers.push_back(Header{trim(text.substr(0, colon)), trim(text.substr(colon + 1))});
    }

    if (ctx.psk) {
        std::string_view spec = *ctx.psk;
        size_t colon = spec.find(':');
        if (colon == std::string_view::npos || !parse_hex(spec.substr(colon + 1), ctx.psk_key)) {
            return fail("Invalid --psk, expected identity:hexkey");
        }
        ctx.psk_identity = std::string(spec.substr(0, colon));
    }

    if (ctx.user && ctx.user->find(':') == std::string::npos) return fail("Invalid --user, expected user:password");
    return true;
}

// Applies the common options to either kind of request builder.
template<typename Builder>
void apply_options(Builder& builder, const FSMContext& ctx, const RequestBody* body) {
    if (!ctx.headers.empty()) builder.headers(ctx.headers);
    if (ctx.content_type) builder.content_type(*ctx.content_type);
    if (ctx.user) {
        std::string_view user = *ctx.user;
        size_t colon = user.find(':');
        builder.basic_auth(user.substr(0, colon), user.substr(colon + 1));
    }
    if (body) builder.body(*body);
}

void print_head(const Response& response) {
    std::cerr << "HTTP/1.1 " << response.status().code << " " << response.reason() << "\n";
    for (const auto& header : response.headers()) {
        std::cerr << header.name << ": " << header.value << "\n";
    }
    std::cerr << "\n";
}

int stream_body(Response& response) {
    auto reader = response.body();
    if (!reader) {
        std::cerr << "Error: " << reader.error().message << "\n";
        return 1;
    }

    std::vector<char> chunk(4096);
    while (true) {
        auto n = reader->read(chunk);
        if (!n) {
            std::cerr << "Error: " << n.error().message << "\n";
            return 1;
        }
        if (*n == 0) break;
        std::cout.write(chunk.data(), static_cast<std::streamsize>(*n));
    }
    std::cout.flush();

    auto status = response.status();
    return (status.is_success() || status.is_redirection()) ? 0 : 1;
}

int main(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};

    PosixDns dns;
    std::optional<PosixConnector> connector;
    std::optional<HttpClient> client;
    std::optional<HttpRequestHandle> handle;
    std::optional<HttpResource> resource;
    std::optional<Response> response;
    std::optional<BytesBody> bytes_body;
    std::optional<ChunkedBody> chunked_body;
    std::string_view fragment;
    std::vector<char> rx_buf;
    std::vector<char> tx_buf;
    std::vector<char> tls_rx;
    std::vector<char> tls_tx;

    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                if (ctx.argc < 3) {
                    print_usage(ctx.argv[0]);
                    ctx.exit_code = 1;
                    state = FSMState::Done;
                } else {
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs: {
                auto method = parse_method(ctx.argv[1]);
                if (!method) {
                    ctx.error_message = "Unknown method: " + std::string(ctx.argv[1]);
                    state = FSMState::Error;
                    break;
                }
                ctx.method = *method;
                ctx.url = ctx.argv[2];
                state = parse_options(ctx) ? FSMState::Connect : FSMState::Error;
                break;
            }
            case FSMState::Connect: {
                connector.emplace(SocketConfig{ctx.config.timeout_sec, true});
                rx_buf.resize(ctx.config.rx_buffer);
                tx_buf.resize(ctx.config.tx_buffer);

#ifdef REQLITE_ENABLE_TLS
                if (ctx.psk || ctx.config.insecure) {
                    tls_rx.resize(ctx.config.tls_buffer);
                    tls_tx.resize(ctx.config.tls_buffer);
                    TlsVerify verify = TlsVerify::none();
                    if (ctx.psk) {
                        verify = TlsVerify::pre_shared_key(
                            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(ctx.psk_identity.data()),
                                                     ctx.psk_identity.size()),
                            ctx.psk_key);
                    }
                    client.emplace(dns, *connector, TlsConfig(ctx.config.seed, tls_rx, tls_tx, verify));
                } else {
                    client.emplace(dns, *connector);
                }
#else
                if (ctx.psk || ctx.config.insecure) {
                    ctx.error_message = "TLS options given but TLS is not available in this build";
                    state = FSMState::Error;
                    break;
                }
                client.emplace(dns, *connector);
#endif

                if (ctx.scoped_path) {
                    auto opened = client->resource(ctx.url);
                    if (!opened) {
                        ctx.error_message = opened.error().message;
                        state = FSMState::Error;
                        break;
                    }
                    resource.emplace(std::move(*opened));
                    if (ctx.config.buffered) resource.emplace(std::move(*resource).into_buffered(tx_buf));
                } else {
                    auto opened = client->request(ctx.method, ctx.url);
                    if (!opened) {
                        ctx.error_message = opened.error().message;
                        state = FSMState::Error;
                        break;
                    }
                    handle.emplace(std::move(*opened));
                    if (ctx.config.buffered) handle.emplace(std::move(*handle).into_buffered(tx_buf));
                }
                state = FSMState::Send;
                break;
            }
            case FSMState::Send: {
                const RequestBody* body = nullptr;
                if (ctx.data && ctx.config.chunked) {
                    fragment = *ctx.data;
                    chunked_body.emplace(std::span<const std::string_view>(&fragment, 1));
                    body = &*chunked_body;
                } else if (ctx.data) {
                    bytes_body.emplace(std::string_view(*ctx.data));
                    body = &*bytes_body;
                }

                std::expected<Response, HttpErrorInfo> sent = std::unexpected(
                    setup_error(HttpError::AlreadySent, "No request prepared"));
                if (resource) {
                    auto builder = resource->request(ctx.method, *ctx.scoped_path);
                    apply_options(builder, ctx, body);
                    sent = builder.send(rx_buf);
                } else {
                    apply_options(*handle, ctx, body);
                    sent = handle->send(rx_buf);
                }

                if (!sent) {
                    ctx.error_message = sent.error().message;
                    state = FSMState::Error;
                    break;
                }
                response.emplace(std::move(*sent));
                print_head(*response);
                state = FSMState::ReadBody;
                break;
            }
            case FSMState::ReadBody:
                ctx.exit_code = stream_body(*response);
                state = FSMState::Done;
                break;
            case FSMState::Error:
                std::cerr << "Error: " << ctx.error_message << "\n";
                ctx.exit_code = 1;
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}
