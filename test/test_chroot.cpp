// test_chroot.cpp - Tests for re-rooting documents at a dotted path
// Module 10: chroot

#include <catch2/catch_all.hpp>
#include <yamldiff/chroot.h>

#include <string>

using namespace yamldiff;

namespace {

Node sample()
{
    return parse_documents(
        "spec:\n"
        "  template:\n"
        "    containers:\n"
        "    - name: web\n"
        "      image: nginx\n"
        "    - name: sidecar\n"
        "      image: envoy\n"
        "  replicas: 2\n").front();
}

std::string chroot_message(const Node& doc, std::string_view path)
{
    try {
        (void)navigate_to_path(doc, path);
    } catch (const ChrootError& e) {
        return e.what();
    }
    return {};
}

} // namespace

TEST_CASE("navigate_to_path", "[chroot][navigate]") {
    auto doc = sample();

    SECTION("empty path is the document") {
        REQUIRE(navigate_to_path(doc, "").is_map());
        REQUIRE(navigate_to_path(doc, "").contains("spec"));
    }

    SECTION("map keys") {
        REQUIRE(navigate_to_path(doc, "spec.replicas").as_int() == 2);
    }

    SECTION("list index") {
        auto c = navigate_to_path(doc, "spec.template.containers[1]");
        REQUIRE(c.at("name").as_string() == "sidecar");
        REQUIRE(navigate_to_path(doc, "spec.template.containers[0].image").as_string() == "nginx");
    }
}

TEST_CASE("navigate_to_path errors", "[chroot][error]") {
    auto doc = sample();

    SECTION("missing key") {
        REQUIRE_THROWS_AS(navigate_to_path(doc, "spec.missing"), ChrootError);
        REQUIRE(chroot_message(doc, "spec.missing") == "chroot path \"spec.missing\": key \"missing\" not found");
    }

    SECTION("index out of bounds") {
        REQUIRE(chroot_message(doc, "spec.template.containers[5]") ==
                "chroot path \"spec.template.containers[5]\": index 5 out of bounds (list has 2 items)");
    }

    SECTION("wrong kind") {
        REQUIRE(chroot_message(doc, "spec[0]") == "chroot path \"spec[0]\": expected list at [0], got map");
        REQUIRE(chroot_message(doc, "spec.replicas.x") ==
                "chroot path \"spec.replicas.x\": expected map at \"x\", got int");
    }

    SECTION("syntax error") {
        REQUIRE_THROWS_AS(navigate_to_path(doc, "spec[x]"), ChrootError);
    }

    SECTION("path is kept") {
        try {
            (void)navigate_to_path(doc, "nope");
            FAIL("expected ChrootError");
        } catch (const ChrootError& e) {
            REQUIRE(e.path() == "nope");
        }
    }
}

TEST_CASE("apply_chroot_to_documents", "[chroot][documents]") {
    DocumentList docs{sample(), sample()};

    SECTION("each document is re-rooted") {
        auto result = apply_chroot_to_documents(docs, "spec.replicas");
        REQUIRE(result.size() == 2);
        REQUIRE(result[1].as_int() == 2);
    }

    SECTION("empty path keeps the documents") {
        REQUIRE(apply_chroot_to_documents(docs, "").size() == 2);
    }

    SECTION("list target stays one document by default") {
        auto result = apply_chroot_to_documents(DocumentList{sample()}, "spec.template.containers");
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].is_list());
    }

    SECTION("list target split into documents") {
        auto result = apply_chroot_to_documents(DocumentList{sample()}, "spec.template.containers", true);
        REQUIRE(result.size() == 2);
        REQUIRE(result[0].at("name").as_string() == "web");
        REQUIRE(result[1].at("name").as_string() == "sidecar");
    }

    SECTION("failure in any document fails the whole call") {
        DocumentList mixed{sample(), Node::map({{"other", 1}})};
        REQUIRE_THROWS_AS(apply_chroot_to_documents(mixed, "spec"), ChrootError);
    }
}
