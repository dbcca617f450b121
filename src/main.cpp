//
// main.cpp: GridDuel match server, WebSocket play and HTTP matchmaking on one port
//

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <random>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/AbilityRegistry.hpp"
#include "core/Catalog.hpp"
#include "core/ClassicRules.hpp"
#include "core/Exception.hpp"
#include "core/Game.hpp"
#include "core/Heuristic.hpp"
#include "net/AsioScheduler.hpp"
#include "net/Auth.hpp"
#include "net/GameStore.hpp"
#include "net/Matchmaking.hpp"
#include "net/Rewards.hpp"
#include "net/SessionManager.hpp"
#include "net/WsConnection.hpp"
#include "net/protocol.hpp"

namespace
{
    using gridduel::net::WsServer;
    using gridduel::net::Hdl;
    using json = nlohmann::json;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::optional<std::uint64_t> seed{};
        std::string catalog{"data/catalog.json"};
        std::vector<std::chrono::seconds> turn_durations{
            std::chrono::seconds{30}, std::chrono::seconds{15}, std::chrono::seconds{10}, std::chrono::seconds{5}
        };
        std::chrono::milliseconds grace{15000};
        std::chrono::milliseconds ai_delay{1200};
        gridduel::core::Difficulty ai_difficulty{gridduel::core::Difficulty::Medium};
        std::size_t min_deck{10};
        std::string audit_dir{};
        std::uint8_t level_step{2};
    };

    auto ParseDurations(std::string_view text) -> std::optional<std::vector<std::chrono::seconds>>
    {
        std::vector<std::chrono::seconds> out;
        while (!text.empty())
        {
            auto const comma = text.find(',');
            std::string_view const item = text.substr(0, comma);

            std::uint64_t v{};
            auto const res = std::from_chars(item.data(), item.data() + item.size(), v);
            if (res.ec != std::errc{} || res.ptr != item.data() + item.size() || v == 0)
            {
                return std::nullopt;
            }
            out.emplace_back(static_cast<std::chrono::seconds::rep>(v));

            if (comma == std::string_view::npos) break;
            text.remove_prefix(comma + 1);
        }
        if (out.empty()) return std::nullopt;
        return out;
    }

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };
            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--catalog")
            {
                if (!next_str(cfg.catalog)) { std::print("[gridduel] --catalog needs a path\n"); }
            }
            else if (arg == "--turn-durations")
            {
                std::string v;
                if (next_str(v))
                {
                    if (auto d = ParseDurations(v)) { cfg.turn_durations = std::move(*d); }
                    else { std::print("[gridduel] ignoring bad --turn-durations '{}'\n", v); }
                }
            }
            else if (arg == "--grace-ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.grace = std::chrono::milliseconds(v); }
            }
            else if (arg == "--ai-delay-ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.ai_delay = std::chrono::milliseconds(v); }
            }
            else if (arg == "--ai-difficulty")
            {
                std::string v;
                if (next_str(v))
                {
                    if (auto d = gridduel::core::ParseDifficulty(v)) { cfg.ai_difficulty = *d; }
                    else { std::print("[gridduel] ignoring bad --ai-difficulty '{}'\n", v); }
                }
            }
            else if (arg == "--min-deck")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.min_deck = static_cast<std::size_t>(v); }
            }
            else if (arg == "--audit-dir")
            {
                if (!next_str(cfg.audit_dir)) { std::print("[gridduel] --audit-dir needs a path\n"); }
            }
            else if (arg == "--level-step")
            {
                std::uint64_t v{};
                if (next_uint(v) && v > 0) { cfg.level_step = static_cast<std::uint8_t>(v); }
            }
            else
            {
                std::print("[gridduel] unknown option {}\n", arg);
            }
        }
        return cfg;
    }

    // Open sockets keyed by their websocketpp connection.
    class ClientTable
    {
    public:
        auto Add(void* key, gridduel::net::WsConnectionSP conn) -> void
        {
            std::scoped_lock lock(mx_);
            by_key_.insert_or_assign(key, std::move(conn));
        }

        auto Remove(void* key) -> gridduel::net::WsConnectionSP
        {
            std::scoped_lock lock(mx_);
            auto const it = by_key_.find(key);
            if (it == by_key_.end()) return nullptr;
            auto conn = std::move(it->second);
            by_key_.erase(it);
            return conn;
        }

        auto Find(void* key) const -> gridduel::net::WsConnectionSP
        {
            std::scoped_lock lock(mx_);
            auto const it = by_key_.find(key);
            return it == by_key_.end() ? nullptr : it->second;
        }

        auto OfUser(gridduel::core::PlayerId const& user) const -> std::vector<gridduel::net::WsConnectionSP>
        {
            std::scoped_lock lock(mx_);
            std::vector<gridduel::net::WsConnectionSP> out;
            for (auto const& [key, conn] : by_key_)
            {
                if (conn->User() == user) out.push_back(conn);
            }
            return out;
        }

        auto All() const -> std::vector<gridduel::net::WsConnectionSP>
        {
            std::scoped_lock lock(mx_);
            std::vector<gridduel::net::WsConnectionSP> out;
            out.reserve(by_key_.size());
            for (auto const& [key, conn] : by_key_) out.push_back(conn);
            return out;
        }

    private:
        mutable std::mutex mx_;
        std::unordered_map<void*, gridduel::net::WsConnectionSP> by_key_;
    };

    auto Reply(gridduel::net::Connection& conn, std::string const& text) -> void
    {
        if (!conn.Send(text))
        {
            std::print("[gridduel] reply to connection {} dropped\n", conn.Id());
        }
    }

    auto Respond(WsServer::connection_ptr const& con, websocketpp::http::status_code::value code,
                 json const& body) -> void
    {
        con->set_status(code);
        con->append_header("Content-Type", "application/json");
        con->set_body(body.dump());
    }

    auto PathOf(std::string const& resource) -> std::string
    {
        return resource.substr(0, resource.find('?'));
    }

    auto HandleHttp(WsServer::connection_ptr const& con,
                    gridduel::net::Authenticator const& auth,
                    gridduel::net::MatchmakingQueue& queue,
                    gridduel::core::Difficulty const default_difficulty) -> void
    {
        namespace sc = websocketpp::http::status_code;

        std::string const path = PathOf(con->get_resource());
        std::string const& method = con->get_request().get_method();

        auto const token = gridduel::net::TokenFromBearer(con->get_request_header("Authorization"));
        auto const user = token ? auth.Authenticate(*token) : std::nullopt;
        if (!user)
        {
            Respond(con, sc::unauthorized, json{{"error", "missing or invalid bearer token"}});
            return;
        }

        if (method == "POST" && path == "/matchmaking/join")
        {
            json const body = json::parse(con->get_request_body(), nullptr, false);
            if (body.is_discarded() || !body.is_object() || !body.contains("deckRef") || !body["deckRef"].is_string())
            {
                Respond(con, sc::bad_request, json{{"error", "body must be {\"deckRef\": string}"}});
                return;
            }

            auto joined = queue.Join(*user, body["deckRef"].get<std::string>());
            if (!joined)
            {
                Respond(con, sc::bad_request, json{{"error", joined.error().message}});
            }
            else if (joined->status == gridduel::net::QueueStatus::Matched)
            {
                Respond(con, sc::ok, json{{"status", "matched"}, {"matchId", *joined->match_id}});
            }
            else
            {
                Respond(con, sc::accepted, json{{"status", "queued"}});
            }
            return;
        }

        if (method == "POST" && path == "/matchmaking/solo")
        {
            json const body = json::parse(con->get_request_body(), nullptr, false);
            if (body.is_discarded() || !body.is_object() || !body.contains("deckRef") || !body["deckRef"].is_string())
            {
                Respond(con, sc::bad_request, json{{"error", "body must be {\"deckRef\": string}"}});
                return;
            }

            auto difficulty = std::optional<gridduel::core::Difficulty>{default_difficulty};
            if (body.contains("difficulty"))
            {
                difficulty = body["difficulty"].is_string()
                                 ? gridduel::core::ParseDifficulty(body["difficulty"].get<std::string>())
                                 : std::nullopt;
            }
            if (!difficulty)
            {
                Respond(con, sc::bad_request, json{{"error", "difficulty must be easy, medium or hard"}});
                return;
            }

            std::string const ai_deck = body.contains("aiDeckRef") && body["aiDeckRef"].is_string()
                                            ? body["aiDeckRef"].get<std::string>()
                                            : std::string{};
            auto started = queue.StartSolo(*user, body["deckRef"].get<std::string>(), *difficulty, ai_deck);
            if (!started)
            {
                Respond(con, sc::bad_request, json{{"error", started.error().message}});
                return;
            }
            Respond(con, sc::ok, json{{"status", "matched"}, {"matchId", *started->match_id}});
            return;
        }

        if (method == "GET" && path == "/matchmaking/status")
        {
            gridduel::net::JoinResult const st = queue.Status(*user);
            json body{{"status", std::string{gridduel::net::to_string(st.status)}}};
            if (st.match_id) body["matchId"] = *st.match_id;
            Respond(con, sc::ok, body);
            return;
        }

        if (method == "POST" && path == "/matchmaking/leave")
        {
            bool const left = queue.Leave(*user);
            Respond(con, sc::ok, json{{"ok", true}, {"left", left}});
            return;
        }

        Respond(con, sc::not_found, json{{"error", std::format("no endpoint {} {}", method, path)}});
    }
}

int main(int argc, char** argv)
{
    using namespace gridduel;
    using namespace gridduel::core;

    ServerConfig const sc = ParseArgs(argc, argv);
    std::uint64_t const seed = sc.seed.value_or(std::random_device{}());

    std::print("[gridduel] starting on port {} (seed {}, catalog {})\n", sc.port, seed, sc.catalog);

    Config cfg;
    cfg.level_step = sc.level_step;
    cfg.seed = seed;

    std::shared_ptr<Catalog> catalog;
    std::shared_ptr<GameEngine const> engine;
    try
    {
        catalog = Catalog::LoadFile(sc.catalog, cfg.level_step);
        auto registry = std::make_shared<AbilityRegistry const>(MakeStandardRegistry());
        engine = std::make_shared<GameEngine const>(cfg, std::make_unique<ClassicRules>(), registry, catalog);
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("[gridduel] startup failed: {}\n", e);
        return 1;
    }

    auto ep = std::make_shared<WsServer>();
    ep->clear_access_channels(websocketpp::log::alevel::all);
    ep->clear_error_channels(websocketpp::log::elevel::all);

    ep->init_asio();
    ep->set_reuse_addr(true);

    net::SessionDeps deps;
    deps.engine = engine;
    deps.heuristic = std::make_shared<Heuristic>(seed ^ 0x9e3779b97f4a7c15ULL);
    deps.store = std::make_shared<net::InMemoryGameStore>();
    deps.rewards = std::make_shared<net::LoggingRewardsSink>();
    deps.scheduler = std::make_shared<net::AsioScheduler>(ep->get_io_service());

    net::SessionConfig scfg;
    scfg.turn_durations = sc.turn_durations;
    scfg.grace = sc.grace;
    scfg.forced_difficulty = sc.ai_difficulty;
    scfg.ai_delay = sc.ai_delay;
    scfg.audit_dir = sc.audit_dir;

    auto sessions = std::make_shared<net::SessionManager>(deps, scfg);
    auto queue = std::make_shared<net::MatchmakingQueue>(engine, catalog, deps.store, sessions,
                                                         net::MatchmakingConfig{sc.min_deck});
    net::TrustingAuthenticator const auth;

    ClientTable clients;
    net::ConnectionId next_conn_id{1};

    queue->OnMatched([&clients](PlayerId const& user, MatchId const& match)
    {
        for (auto const& conn : clients.OfUser(user)) Reply(*conn, net::protocol::MakeMatched(match));
    });

    ep->set_open_handler([&](Hdl hdl)
    {
        auto con = ep->get_con_from_hdl(hdl);

        auto const token = net::TokenFromQuery(con->get_resource());
        auto const user = token ? auth.Authenticate(*token) : std::nullopt;
        if (!user)
        {
            websocketpp::lib::error_code ec;
            ep->close(hdl, websocketpp::close::status::policy_violation, "unauthenticated", ec);
            return;
        }

        auto conn = std::make_shared<net::WsConnection>(next_conn_id++, ep, hdl, *user);
        std::print("[gridduel] {} connected (connection {})\n", *user, conn->Id());
        clients.Add(con.get(), std::move(conn));
    });

    ep->set_close_handler([&](Hdl hdl)
    {
        auto con = ep->get_con_from_hdl(hdl);
        net::WsConnectionSP conn = clients.Remove(con.get());
        if (!conn)
        {
            return;
        }

        std::print("[gridduel] {} closed connection {}\n", conn->User(), conn->Id());
        if (conn->Match())
        {
            if (net::MatchSessionSP session = sessions->Find(*conn->Match()))
            {
                session->Disconnect(conn->User(), conn->Id());
            }
        }
    });

    ep->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        auto con = ep->get_con_from_hdl(hdl);
        net::WsConnectionSP conn = clients.Find(con.get());
        if (!conn)
        {
            return;
        }

        if (msg->get_opcode() != websocketpp::frame::opcode::text)
        {
            Reply(*conn, net::protocol::MakeError("text frames only"));
            return;
        }

        auto parsed = net::protocol::ParseClientMessage(msg->get_payload());
        if (!parsed)
        {
            Reply(*conn, net::protocol::MakeError(parsed.error().message));
            return;
        }

        std::visit([&]<typename T0>(T0 const& m)
        {
            using T = std::decay_t<T0>;

            net::MatchSessionSP session = sessions->Find(m.match_id);
            if (!session)
            {
                Reply(*conn, net::protocol::MakeError(std::format("Match {} not found", m.match_id)));
                return;
            }

            if constexpr (std::is_same_v<T, net::protocol::JoinGame>)
            {
                conn->SetMatch(m.match_id);
                session->Join(conn->User(), conn);
            }
            else if constexpr (std::is_same_v<T, net::protocol::Action>)
            {
                if (conn->Match() != m.match_id)
                {
                    Reply(*conn, net::protocol::MakeError("join the match before acting"));
                    return;
                }
                session->HandleAction(conn->User(), conn->Id(), m.action);
            }
            else
            {
                session->HandleAnimationsComplete(conn->User());
            }
        }, *parsed);
    });

    ep->set_http_handler([&](Hdl hdl)
    {
        HandleHttp(ep->get_con_from_hdl(hdl), auth, *queue, sc.ai_difficulty);
    });

    std::unique_ptr<net::TimerHandle> stop_timer;
    boost::asio::signal_set signals(ep->get_io_service(), SIGINT, SIGTERM);
    signals.async_wait([&](boost::system::error_code const& ec, int signo)
    {
        if (ec)
        {
            return;
        }

        std::print("[gridduel] signal {}, shutting down\n", signo);
        queue->Stop();
        sessions->Stop();

        websocketpp::lib::error_code lec;
        ep->stop_listening(lec);
        for (auto const& conn : clients.All()) conn->Close("server shutting down");

        // let the close handshakes go out before the loop ends
        stop_timer = deps.scheduler->Schedule(std::chrono::milliseconds(500), [&ep] { ep->stop(); });
    });

    sessions->Start();
    queue->Start();

    ep->listen(sc.port);
    ep->start_accept();
    ep->run();

    std::print("[gridduel] stopped\n");
    return 0;
}
