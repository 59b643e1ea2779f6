// ═══════════════════════════════════════════════════════════════════
//  main.cpp — fedgate-server
// ═══════════════════════════════════════════════════════════════════
//
//    fedgate-server [config.json]
//
//  The path defaults to $FEDGATE_CONFIG, then config/gateway.json.
// ═══════════════════════════════════════════════════════════════════

#include <fedgate/compress.h>
#include <fedgate/config.h>
#include <fedgate/console.h>
#include <fedgate/gateway.h>
#include <fedgate/http.h>
#include <fedgate/lifecycle.h>
#include <fedgate/middleware.h>
#include <fedgate/observability.h>
#include <cstdlib>

using namespace fedgate;

int main(int argc, char** argv) {
    std::string path = "config/gateway.json";
    if (const char* env = std::getenv("FEDGATE_CONFIG"); env && *env) path = env;
    if (argc > 1) path = argv[1];

    config::GatewayConfig cfg;
    try {
        cfg = config::loadConfig(path);
    } catch (const ConfigError& e) {
        console::error(e.what());
        return 1;
    }
    console::setLevel(console::parseLevel(cfg.logLevel));

    gateway::Gateway gw(cfg, std::make_shared<client::HttpSubgraphClient>());
    auto loaded = gw.loadServiceDefinitions();
    console::info("Loaded", loaded, "of", cfg.subgraphs.size(), "subgraph service definition(s)");
    gw.start();

    auto app = http::createServer();
    app.setLimits({.maxBodyBytes = cfg.server.maxBodyBytes, .readTimeoutMs = cfg.server.readTimeoutMs});
    app.use(observability::requestId());
    app.use(middleware::requestLogger());
    app.use(middleware::cors({.origins = cfg.server.corsOrigins}));
    app.use(compress::compression());
    app.use(middleware::bodyParser());
    gw.mount(app);

    lifecycle::SignalWatcher signals;
    signals.onShutdown([&gw](int) { gw.stop(); });
    signals.onReload([&gw, path] { gw.reload(config::loadConfig(path)); });
    signals.watch(app);

    try {
        app.listen(cfg.server.host, cfg.server.port, cfg.server.threads, [&cfg] {
            console::success("fedgate listening on http://" + cfg.server.host + ":" +
                             std::to_string(cfg.server.port));
            console::log("  POST /graphql    GET /health    GET /schema    GET /subgraphs");
        });
    } catch (const std::exception& e) {
        console::error("Server failed:", e.what());
        gw.stop();
        return 1;
    }

    gw.stop();
    return 0;
}
