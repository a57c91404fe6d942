#include "hideez/choices.hpp"

namespace hideez {

namespace {

struct ScriptTypeRow {
    const char* name;
    InputScriptType input;
    OutputScriptType output;
};

const ScriptTypeRow SCRIPT_TYPES[] = {
    {"address",     InputScriptType::SPENDADDRESS,     OutputScriptType::PAYTOADDRESS},
    {"segwit",      InputScriptType::SPENDWITNESS,     OutputScriptType::PAYTOWITNESS},
    {"p2sh-segwit", InputScriptType::SPENDP2SHWITNESS, OutputScriptType::PAYTOP2SHWITNESS},
};

struct CurveRow {
    const char* name;
    Curve curve;
};

const CurveRow CURVES[] = {
    {"secp256k1", Curve::SECP256K1},
    {"nist256p1", Curve::NIST256P1},
    {"ed25519",   Curve::ED25519},
};

} // namespace

const std::vector<std::string>& script_type_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> v;
        for (const auto& row : SCRIPT_TYPES) v.emplace_back(row.name);
        return v;
    }();
    return names;
}

const std::vector<std::string>& curve_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> v;
        for (const auto& row : CURVES) v.emplace_back(row.name);
        return v;
    }();
    return names;
}

bool input_script_type_from_name(const std::string& name, InputScriptType& out, std::string& err) {
    for (const auto& row : SCRIPT_TYPES) {
        if (name == row.name) { out = row.input; return true; }
    }
    err = "bad_value:script_type";
    return false;
}

bool output_script_type_from_name(const std::string& name, OutputScriptType& out, std::string& err) {
    for (const auto& row : SCRIPT_TYPES) {
        if (name == row.name) { out = row.output; return true; }
    }
    err = "bad_value:script_type";
    return false;
}

bool curve_from_name(const std::string& name, Curve& out, std::string& err) {
    for (const auto& row : CURVES) {
        if (name == row.name) { out = row.curve; return true; }
    }
    err = "bad_value:curve";
    return false;
}

const char* to_wire(InputScriptType t) {
    switch (t) {
        case InputScriptType::SPENDADDRESS:     return "SPENDADDRESS";
        case InputScriptType::SPENDMULTISIG:    return "SPENDMULTISIG";
        case InputScriptType::EXTERNAL:         return "EXTERNAL";
        case InputScriptType::SPENDWITNESS:     return "SPENDWITNESS";
        case InputScriptType::SPENDP2SHWITNESS: return "SPENDP2SHWITNESS";
    }
    return "SPENDADDRESS";
}

const char* to_wire(OutputScriptType t) {
    switch (t) {
        case OutputScriptType::PAYTOADDRESS:     return "PAYTOADDRESS";
        case OutputScriptType::PAYTOSCRIPTHASH:  return "PAYTOSCRIPTHASH";
        case OutputScriptType::PAYTOMULTISIG:    return "PAYTOMULTISIG";
        case OutputScriptType::PAYTOOPRETURN:    return "PAYTOOPRETURN";
        case OutputScriptType::PAYTOWITNESS:     return "PAYTOWITNESS";
        case OutputScriptType::PAYTOP2SHWITNESS: return "PAYTOP2SHWITNESS";
    }
    return "PAYTOADDRESS";
}

const char* to_wire(Curve c) {
    for (const auto& row : CURVES) {
        if (row.curve == c) return row.name;
    }
    return "secp256k1";
}

std::string default_script_type(const AddressN& path) {
    if (!path.empty() && path[0] == H_(49)) return "p2sh-segwit";
    return "address";
}

} // namespace hideez
