#include "../test_tools.hpp"
#include <catch2/catch_all.hpp>
#include <errors/errors.hpp>
#include <util/commitable_file.hpp>
#include <util/digest.hpp>
#include <util/lookup_table.hpp>
#include <util/string_util.hpp>
#include <util/url.hpp>

// NOLINTBEGIN
SCENARIO("LookupTable", "[util]") {
    GIVEN("A compile-time generated lookup table") {
        constexpr util::LookupTable table{1, 2.0, 2, 3.0, 3, 4.0};

        THEN("Size is correct") {
            STATIC_REQUIRE(table.size() == 3);
        }

        WHEN("Looking up a missing key") {
            constexpr std::optional<double> value = table.lookup(42);
            THEN("Lookup is valueless") {
                STATIC_REQUIRE(value == std::nullopt);
            }
        }

        WHEN("Looking up a key") {
            int key = GENERATE(1, 2, 3);
            THEN("Value is correct") {
                std::optional<double> value = table.lookup(key);
                REQUIRE(value == (1.0 + key));
                AND_THEN("Reverse lookup succeeds") {
                    REQUIRE(table.rlookup(value.value()) == key);
                }
            }
        }
    }
}

SCENARIO("String helpers ignore locale", "[util]") {
    REQUIRE(util::iequals("ValidationURL", "validationurl"));
    REQUIRE_FALSE(util::iequals("Name", "Names"));
    REQUIRE(util::endsWith("centos-7-install", "-install"));
    REQUIRE_FALSE(util::endsWith("install", "-install"));
    REQUIRE(util::lower("ABC-def") == "abc-def");
    REQUIRE(util::join({"a", "b", "c"}, " ") == "a b c");
    REQUIRE(util::join({}, " ").empty());
}

SCENARIO("Commitable file replaces the target atomically", "[util]") {
    test::TempDir tempDir;
    auto target = tempDir.getDir() / "target.txt";
    test::writeFile(target, "old");

    GIVEN("A commitable file with new content") {
        WHEN("The file is committed") {
            {
                util::CommitableFile file{target};
                file.begin() << "new";
                file.commit();
            }
            THEN("The target holds the new content") {
                REQUIRE(test::readFile(target) == "new");
                REQUIRE_FALSE(std::filesystem::exists(util::CommitableFile::getNewFile(target)));
            }
        }
        WHEN("The file is abandoned by going out of scope") {
            {
                util::CommitableFile file{target};
                file.begin() << "partial";
            }
            THEN("The target is unchanged and the side file is gone") {
                REQUIRE(test::readFile(target) == "old");
                REQUIRE_FALSE(std::filesystem::exists(util::CommitableFile::getNewFile(target)));
            }
        }
    }
}

SCENARIO("SHA-256 of a file", "[util]") {
    test::TempDir tempDir;
    auto path = tempDir.getDir() / "abc.iso";
    test::writeFile(path, "abc");
    REQUIRE(
        util::Sha256::ofFile(path)
        == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(
        util::Sha256{}.hexDigest()
        == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

SCENARIO("URL parsing", "[util]") {
    GIVEN("A URL with a port") {
        auto parts = util::parseUrl("http://192.168.124.10:8091/machines/abc?x=1");
        THEN("Scheme, host and path are split") {
            REQUIRE(parts.scheme == "http");
            REQUIRE(parts.host == "192.168.124.10:8091");
            REQUIRE(parts.path == "/machines/abc");
        }
    }
    GIVEN("A URL without a port") {
        auto parts = util::parseUrl("https://example.com/a/b");
        THEN("Host has no port") {
            REQUIRE(parts.host == "example.com");
            REQUIRE(parts.path == "/a/b");
        }
    }
    GIVEN("A URL with nothing after the host") {
        auto parts = util::parseUrl("http://10.0.0.1:8091");
        THEN("The path is empty") {
            REQUIRE(parts.scheme == "http");
            REQUIRE(parts.host == "10.0.0.1:8091");
            REQUIRE(parts.path.empty());
        }
    }
    GIVEN("A reference without a scheme") {
        auto parts = util::parseUrl("/seed/preseed.cfg?arch=amd64");
        THEN("Only the path is set") {
            REQUIRE(parts.scheme.empty());
            REQUIRE(parts.host.empty());
            REQUIRE(parts.path == "/seed/preseed.cfg");
        }
    }
    GIVEN("A host and port without a scheme") {
        THEN("Parsing fails") {
            REQUIRE_THROWS_AS(util::parseUrl("10.0.0.1:8091/x"), errors::InvalidUrlError);
        }
    }
    GIVEN("Something that is not a URL") {
        THEN("Parsing fails") {
            REQUIRE_THROWS_AS(util::parseUrl("::not a url::"), errors::InvalidUrlError);
        }
    }
}
// NOLINTEND
