#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <crow.h>

#include "energymarket/util/system_clock.hpp"
#include "energymarket/core/marketplace.hpp"
#include "energymarket/settlement/internal_ledger_gateway.hpp"
#include "energymarket/report/internal_settlement_repository.hpp"
#include "energymarket/report/report_service.hpp"

using namespace energymarket;

// Global state for demo
struct DemoState {
    std::vector<std::string> commands;
    size_t currentStep = 0;

    std::unique_ptr<util::SystemClock> clock;
    std::unique_ptr<settlement::InternalLedgerGateway> ledger;
    std::unique_ptr<report::InternalSettlementRepository> settlementRepo;
    std::unique_ptr<core::Marketplace> market;
    std::unique_ptr<report::ReportService> reportService;

    std::vector<core::MatchEvent> recentMatches;
} gState;

bool parse_side(const std::string& s, Side& out) {
    if (s == "BUY" || s == "buy") { out = Side::Buy; return true; }
    if (s == "SELL" || s == "sell") { out = Side::Sell; return true; }
    return false;
}

const char* side_name(Side side) {
    return side == Side::Buy ? "buy" : "sell";
}

crow::json::wvalue order_to_json(const core::Order& o) {
    crow::json::wvalue j;
    j["order_id"] = o.orderId;
    j["side"] = side_name(o.side);
    j["buyer"] = o.buyer;
    j["seller"] = o.seller;
    j["quantity"] = o.quantity;
    j["price"] = o.price;
    j["matched"] = o.matched;
    j["executed"] = o.executed;
    if (o.matched) {
        j["matched_order_id"] = o.matchedOrderId;
    }
    j["timestamp_ns"] = static_cast<std::int64_t>(o.timestamp.nanos_since_epoch());
    return j;
}

crow::json::wvalue installation_to_json(const core::Installation& inst) {
    crow::json::wvalue j;
    j["installation_id"] = inst.installationId;
    j["owner"] = inst.owner;
    j["capacity"] = inst.capacity;
    j["installed"] = inst.installed;
    return j;
}

crow::json::wvalue report_to_json() {
    crow::json::wvalue j;
    auto vstats = gState.reportService->volume_all().stats();
    j["settlements"] = vstats.settlementCount;
    j["total_energy"] = vstats.totalEnergy;
    j["total_value"] = vstats.totalValue;

    auto pstats = gState.reportService->price_all().stats();
    if (pstats.isValid()) {
        j["min_price"] = pstats.minPrice;
        j["max_price"] = pstats.maxPrice;
        j["avg_price"] = pstats.avgPrice;
        j["price_std"] = pstats.stdDevPct;
    }
    j["custody"] = gState.market->custody_balance();
    return j;
}

crow::response error_response(int code, const std::string& message) {
    crow::json::wvalue result;
    result["status"] = "error";
    result["message"] = message;
    crow::response res(result);
    res.code = code;
    return res;
}

crow::response reject_response(RejectReason reason) {
    crow::json::wvalue result;
    result["status"] = "error";
    result["reason"] = to_string(reason);
    crow::response res(result);
    res.code = (category_of(reason) == ErrorCategory::StateConflict) ? 409 : 400;
    return res;
}

void load_commands(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open commands file: " << filename << std::endl;
        return;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;
        gState.commands.push_back(line);
    }
    
    std::cout << "Loaded " << gState.commands.size() << " commands\n";
}

void init_market() {
    gState.clock = std::make_unique<util::SystemClock>();
    gState.ledger = std::make_unique<settlement::InternalLedgerGateway>();
    gState.settlementRepo = std::make_unique<report::InternalSettlementRepository>();
    gState.market = std::make_unique<core::Marketplace>(*gState.clock, *gState.ledger, *gState.settlementRepo);
    gState.reportService = std::make_unique<report::ReportService>(*gState.settlementRepo);
    gState.recentMatches.clear();

    gState.market->register_match_listener([](const core::MatchEvent& ev) {
        std::cout << "[match] buy #" << ev.buyOrderId << " (" << ev.buyer << ") <-> sell #"
                  << ev.sellOrderId << " (" << ev.seller << ") qty=" << ev.quantity
                  << " price=" << ev.price << "\n";
        gState.recentMatches.push_back(ev);
        if (gState.recentMatches.size() > 5) {
            gState.recentMatches.erase(gState.recentMatches.begin());
        }
    });

    gState.market->register_payment_listener([](const core::PaymentEvent& ev) {
        const bool sent = ev.direction == core::PaymentDirection::Sent;
        std::cout << (sent ? "[payment sent] to " : "[payment received] from ")
                  << ev.party << " amount=" << ev.amount << "\n";
    });
}

// one scripted line:
//   place <buy|sell> <party> <quantity> <price>
//   match <orderId>
//   execute <orderId> <payment> <caller>
//   register <owner> <capacity> <payment>
//   reject <party> | accept <party>
crow::json::wvalue run_command(const std::string& cmd) {
    crow::json::wvalue result;
    std::istringstream iss(cmd);
    std::string action;
    iss >> action;

    result["command"] = cmd;
    result["action"] = action;

    if (action == "place") {
        std::string sideStr, party;
        Quantity qty = 0;
        Price price = 0;
        iss >> sideStr >> party >> qty >> price;

        Side side;
        if (!iss || !parse_side(sideStr, side)) {
            result["status"] = "error";
            result["message"] = "Invalid order parameters";
            return result;
        }

        api::PlaceOrderRequest req(side, qty, price, party);
        auto vr = gState.market->validate_place_order(req);
        if (vr != RejectReason::None) {
            result["status"] = "error";
            result["reason"] = to_string(vr);
            return result;
        }
        result["status"] = "success";
        result["order_id"] = gState.market->place_order(req);
    }
    else if (action == "match") {
        OrderId id = 0;
        iss >> id;
        if (!iss) {
            result["status"] = "error";
            result["message"] = "Invalid match parameters";
            return result;
        }
        auto mr = gState.market->match_order(id);
        result["status"] = mr.ok() ? "success" : "error";
        result["reason"] = to_string(mr.reason);
        result["matched"] = mr.matched;
        if (mr.matched) {
            result["sell_order_id"] = mr.match.sellOrderId;
            result["price"] = mr.match.price;
        }
    }
    else if (action == "execute") {
        OrderId id = 0;
        Amount payment = 0;
        std::string caller;
        iss >> id >> payment >> caller;
        if (!iss) {
            result["status"] = "error";
            result["message"] = "Invalid execute parameters";
            return result;
        }
        auto er = gState.market->execute_order(id, payment, caller);
        result["status"] = (er == RejectReason::None) ? "success" : "error";
        result["reason"] = to_string(er);
    }
    else if (action == "register") {
        std::string owner;
        Capacity capacity = 0;
        Amount payment = 0;
        iss >> owner >> capacity >> payment;
        if (!iss) {
            result["status"] = "error";
            result["message"] = "Invalid registration parameters";
            return result;
        }

        api::RegisterInstallationRequest req(owner, capacity, payment);
        auto vr = gState.market->validate_register_installation(req);
        if (vr != RejectReason::None) {
            result["status"] = "error";
            result["reason"] = to_string(vr);
            return result;
        }
        InstallationId id = gState.market->register_installation(req);
        if (id == INVALID_INSTALLATION_ID) {
            result["status"] = "error";
            result["reason"] = to_string(gState.market->validate_register_installation(req));
            return result;
        }
        result["status"] = "success";
        result["installation_id"] = id;
    }
    else if (action == "reject" || action == "accept") {
        std::string party;
        iss >> party;
        if (!iss) {
            result["status"] = "error";
            result["message"] = "Invalid ledger parameters";
            return result;
        }
        gState.ledger->set_rejecting(party, action == "reject");
        result["status"] = "success";
    }
    else {
        result["status"] = "error";
        result["message"] = "Unknown command";
    }

    return result;
}

crow::json::wvalue state_to_json() {
    crow::json::wvalue result;
    result["current_step"] = gState.currentStep;
    result["total_steps"] = gState.commands.size();

    std::vector<crow::json::wvalue> orders;
    for (const auto& o : gState.market->orders()) {
        orders.push_back(order_to_json(o));
    }
    result["orders"] = std::move(orders);

    std::vector<crow::json::wvalue> matches;
    for (const auto& ev : gState.recentMatches) {
        crow::json::wvalue m;
        m["buy_order_id"] = ev.buyOrderId;
        m["sell_order_id"] = ev.sellOrderId;
        m["quantity"] = ev.quantity;
        m["price"] = ev.price;
        matches.push_back(std::move(m));
    }
    result["recent_matches"] = std::move(matches);
    result["report"] = report_to_json();
    return result;
}

int main(int argc, char** argv) {
    std::string casesFile = (argc > 1) ? argv[1] : "cases.txt";
    std::uint16_t port = 8080;
    try {
        if (argc > 2) port = static_cast<std::uint16_t>(std::stoul(argv[2]));
    }
    catch (const std::exception& e) {
        std::cerr << "Invalid port '" << argv[2] << "': " << e.what() << std::endl;
        return 1;
    }

    // Initialize
    init_market();
    load_commands(casesFile);
    
    crow::SimpleApp app;

    CROW_ROUTE(app, "/api/orders").methods(crow::HTTPMethod::Post)([](const crow::request& req){
        auto body = crow::json::load(req.body);
        if (!body || !body.has("side") || !body.has("quantity") || !body.has("price") || !body.has("party")) {
            return error_response(400, "expected side, quantity, price, party");
        }

        Side side;
        if (!parse_side(std::string(body["side"].s()), side)) {
            return error_response(400, "side must be buy or sell");
        }

        api::PlaceOrderRequest placeReq(side,
                                        static_cast<Quantity>(body["quantity"].u()),
                                        static_cast<Price>(body["price"].u()),
                                        std::string(body["party"].s()));
        auto vr = gState.market->validate_place_order(placeReq);
        if (vr != RejectReason::None) return reject_response(vr);

        crow::json::wvalue result;
        result["status"] = "success";
        result["order_id"] = gState.market->place_order(placeReq);
        return crow::response(result);
    });

    CROW_ROUTE(app, "/api/orders")([](){
        std::vector<crow::json::wvalue> orders;
        for (const auto& o : gState.market->orders()) {
            orders.push_back(order_to_json(o));
        }
        crow::json::wvalue result;
        result["order_count"] = orders.size();
        result["orders"] = std::move(orders);
        return crow::response(result);
    });

    CROW_ROUTE(app, "/api/orders/<uint>")([](std::uint64_t id){
        auto order = gState.market->get_order(id);
        if (!order) return error_response(404, "order not found");
        return crow::response(order_to_json(*order));
    });

    CROW_ROUTE(app, "/api/orders/<uint>/match").methods(crow::HTTPMethod::Post)([](const crow::request&, std::uint64_t id){
        auto mr = gState.market->match_order(id);
        if (!mr.ok()) return reject_response(mr.reason);

        crow::json::wvalue result;
        result["status"] = "success";
        result["matched"] = mr.matched;
        if (mr.matched) {
            result["sell_order_id"] = mr.match.sellOrderId;
            result["price"] = mr.match.price;
        }
        return crow::response(result);
    });

    CROW_ROUTE(app, "/api/orders/<uint>/execute").methods(crow::HTTPMethod::Post)([](const crow::request& req, std::uint64_t id){
        auto body = crow::json::load(req.body);
        if (!body || !body.has("payment") || !body.has("caller")) {
            return error_response(400, "expected payment, caller");
        }

        auto er = gState.market->execute_order(id,
                                               static_cast<Amount>(body["payment"].u()),
                                               std::string(body["caller"].s()));
        if (er != RejectReason::None) return reject_response(er);

        crow::json::wvalue result;
        result["status"] = "success";
        return crow::response(result);
    });

    CROW_ROUTE(app, "/api/installations").methods(crow::HTTPMethod::Post)([](const crow::request& req){
        auto body = crow::json::load(req.body);
        if (!body || !body.has("owner") || !body.has("capacity") || !body.has("payment")) {
            return error_response(400, "expected owner, capacity, payment");
        }

        api::RegisterInstallationRequest regReq(std::string(body["owner"].s()),
                                                static_cast<Capacity>(body["capacity"].u()),
                                                static_cast<Amount>(body["payment"].u()));
        auto vr = gState.market->validate_register_installation(regReq);
        if (vr != RejectReason::None) return reject_response(vr);

        InstallationId id = gState.market->register_installation(regReq);
        if (id == INVALID_INSTALLATION_ID) {
            return reject_response(gState.market->validate_register_installation(regReq));
        }

        crow::json::wvalue result;
        result["status"] = "success";
        result["installation_id"] = id;
        return crow::response(result);
    });

    CROW_ROUTE(app, "/api/installations/<uint>")([](std::uint64_t id){
        auto inst = gState.market->get_installation(id);
        if (!inst) return reject_response(RejectReason::NotInstalled);
        return crow::response(installation_to_json(*inst));
    });

    CROW_ROUTE(app, "/api/report")([](){
        return crow::response(report_to_json());
    });
    
    CROW_ROUTE(app, "/api/reset").methods(crow::HTTPMethod::Post)([](const crow::request&){
        gState.currentStep = 0;
        init_market();
        
        crow::json::wvalue result;
        result["status"] = "success";
        result["message"] = "Demo reset";
        return crow::response(result);
    });
    
    CROW_ROUTE(app, "/api/step").methods(crow::HTTPMethod::Post)([](const crow::request&){
        if (gState.currentStep >= gState.commands.size()) {
            crow::json::wvalue result;
            result["status"] = "completed";
            result["message"] = "All steps completed";
            return crow::response(result);
        }
        
        crow::json::wvalue result = run_command(gState.commands[gState.currentStep]);
        result["step"] = gState.currentStep;
        result["total_steps"] = gState.commands.size();
        result["state"] = state_to_json();

        gState.currentStep++;
        
        return crow::response(result);
    });
    
    CROW_ROUTE(app, "/api/state")([](){
        return crow::response(state_to_json());
    });
    
    std::cout << "Starting web server on http://localhost:" << port << "\n";
    
    // single worker: the demo state is shared without further locking
    app.port(port).concurrency(1).run();
    
    return 0;
}
