#include <doctest/doctest.h>
#include "hideez/choices.hpp"
#include "hideez/coins.hpp"

using namespace hideez;

TEST_CASE("Script type names map to input and output types") {
    std::string err;
    InputScriptType in;
    OutputScriptType out;

    REQUIRE(input_script_type_from_name("p2sh-segwit", in, err));
    CHECK(in == InputScriptType::SPENDP2SHWITNESS);
    CHECK(std::string(to_wire(in)) == "SPENDP2SHWITNESS");

    REQUIRE(output_script_type_from_name("segwit", out, err));
    CHECK(out == OutputScriptType::PAYTOWITNESS);
    CHECK(std::string(to_wire(out)) == "PAYTOWITNESS");

    REQUIRE(output_script_type_from_name("address", out, err));
    CHECK(out == OutputScriptType::PAYTOADDRESS);

    CHECK(script_type_names() == std::vector<std::string>{"address", "segwit", "p2sh-segwit"});
}

TEST_CASE("Unknown choice names fail with the option name") {
    std::string err;
    InputScriptType in;
    CHECK(!input_script_type_from_name("Address", in, err));
    CHECK(err == "bad_value:script_type");

    Curve c;
    CHECK(!curve_from_name("curve25519", c, err));
    CHECK(err == "bad_value:curve");

    REQUIRE(curve_from_name("ed25519", c, err));
    CHECK(c == Curve::ED25519);
    CHECK(std::string(to_wire(c)) == "ed25519");
}

TEST_CASE("Coin lookup is exact and unknown coins are named in the error") {
    CoinInfo coin;
    std::string err;
    REQUIRE(find_coin("Bitcoin Gold", coin, err));
    CHECK(coin.shortcut == "BTG");
    CHECK(!coin.pushtx_url.empty());

    CHECK(!find_coin("bitcoin", coin, err));
    CHECK(err == "unknown_coin:bitcoin");
}

TEST_CASE("Supported coin list follows table order") {
    CHECK(supported_coin_list() ==
          "Bitcoin, Testnet, Bcash, Litecoin, Dash, Zcash, Bitcoin Gold, Dogecoin");
    CHECK(known_coins().size() == 8);
}
