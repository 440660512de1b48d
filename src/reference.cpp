#include "reference.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace std;

namespace chessmaster {

optional<ReferenceEvaluation> parseReferenceResponse(const string& body) {
    json response;
    try {
        response = json::parse(body);
    } catch (json::parse_error& e) {
        cerr << "JSON Parsing Error: " << e.what() << endl;
        return nullopt;
    }

    if (!response.is_object()) return nullopt;
    if (response.contains("success") && response["success"].is_boolean() && !response["success"].get<bool>()) {
        cerr << "Reference service reported failure: " << response.value("data", string()) << endl;
        return nullopt;
    }

    ReferenceEvaluation result;
    if (response.contains("mate") && response["mate"].is_number_integer()) {
        result.mate = response["mate"].get<int>();
    } else if (response.contains("evaluation") && response["evaluation"].is_number()) {
        result.centipawns = static_cast<int>(lround(response["evaluation"].get<double>() * 100));
    } else {
        cerr << "Invalid evaluation data received from reference service." << endl;
        return nullopt;
    }

    if (response.contains("bestmove") && response["bestmove"].is_string()) {
        // "bestmove e2e4 ponder e7e5"
        istringstream tokens(response["bestmove"].get<string>());
        string token;
        tokens >> token;
        if (token == "bestmove") tokens >> token;
        result.bestMove = token;
    }

    return result;
}

optional<ReferenceEvaluation> ReferenceClient::fetch(const string& fen) const {
    cpr::Response response = cpr::Get(cpr::Url{settings_.url},
                                      cpr::Parameters{{"fen", fen},
                                                      {"depth", to_string(settings_.depth)}});

    if (response.status_code != 200) {
        cerr << "HTTP Request failed with status code: " << response.status_code;
        if (!response.error.message.empty()) cerr << " (" << response.error.message << ")";
        cerr << endl;
        return nullopt;
    }

    return parseReferenceResponse(response.text);
}

} // namespace chessmaster
