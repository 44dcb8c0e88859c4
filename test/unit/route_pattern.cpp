//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <routekit/route_pattern.hpp>

#include <routekit/error.hpp>
#include <boost/core/lightweight_test.hpp>
#include <boost/system/system_error.hpp>
#include <string>
#include <string_view>

namespace routekit {

struct route_pattern_test
{
    static
    void
    bad(
        std::string_view spec,
        error e)
    {
        auto rv = parse_route_pattern(spec);
        if(! BOOST_TEST(rv.has_error()))
            return;
        BOOST_TEST(rv.error() == e);
    }

    static
    route_pattern
    good(std::string_view spec)
    {
        auto rv = parse_route_pattern(spec);
        if(! BOOST_TEST(rv.has_value()))
            return {};
        return *rv;
    }

    void
    testParse()
    {
        {
            auto rp = good("/users");
            BOOST_TEST(rp.methods().empty());
            BOOST_TEST(rp.pattern() == "/users");
            BOOST_TEST(rp.is_literal());
            BOOST_TEST(rp.param_names().empty());
        }
        {
            auto rp = good("GET /users");
            BOOST_TEST(rp.methods().contains("GET"));
            BOOST_TEST(! rp.methods().contains("POST"));
            BOOST_TEST(rp.pattern() == "/users");
            BOOST_TEST(rp.is_literal());
        }
        {
            auto rp = good("GET,POST,PURGE /users/<id>");
            BOOST_TEST(rp.methods().contains("GET"));
            BOOST_TEST(rp.methods().contains("POST"));
            BOOST_TEST(rp.methods().contains("PURGE"));
            BOOST_TEST(! rp.is_literal());
            BOOST_TEST_EQ(rp.param_names().size(), 1u);
            BOOST_TEST_EQ(rp.param_names()[0], "id");
        }
        {
            // no method list: the space follows the path
            auto rp = good("/a b");
            BOOST_TEST(rp.methods().empty());
            BOOST_TEST(rp.pattern() == "/a b");
            BOOST_TEST(rp.is_literal());
        }
        {
            auto rp = good("/files/<dir>/<name:.+>");
            BOOST_TEST_EQ(rp.param_names().size(), 2u);
            BOOST_TEST_EQ(rp.param_names()[0], "dir");
            BOOST_TEST_EQ(rp.param_names()[1], "name");
        }
        {
            // text outside tokens is a regex
            auto rp = good(".*");
            BOOST_TEST(! rp.is_literal());
            BOOST_TEST(rp.param_names().empty());
        }
        {
            auto rp = good("");
            BOOST_TEST(rp.is_literal());
        }

        bad("GET, /x", error::invalid_method);
        bad(",GET /x", error::invalid_method);
        bad("GET,,POST /x", error::invalid_method);
        bad("GE(T /x", error::invalid_method);
        bad("/a/<id", error::invalid_pattern);
        bad("/a/<id:\\d+", error::invalid_pattern);
        bad("/a/<>", error::invalid_pattern);
        bad("/a/<1d>", error::invalid_pattern);
        bad("/a/<id:>", error::invalid_pattern);
        bad("/a/<id;x>", error::invalid_pattern);
        bad("/<a>/<a>", error::duplicate_param);
        bad("/<a>/<b>/<a:\\d+>", error::duplicate_param);
        bad("/a(", error::invalid_regex);
        bad("/<id:[>", error::invalid_regex);

        BOOST_TEST_THROWS(route_pattern("/a/<id"),
            system::system_error);
        BOOST_TEST_NO_THROW(route_pattern("/a/<id>"));
    }

    void
    testMatchLiteral()
    {
        route_pattern rp("/api");
        {
            auto m = rp.match_path("/api/v1");
            BOOST_TEST(m.matched);
            BOOST_TEST(m.rest == "/v1");
            BOOST_TEST(m.params.empty());
        }
        {
            auto m = rp.match_path("/api");
            BOOST_TEST(m.matched);
            BOOST_TEST(m.rest.empty());
        }
        {
            // prefix comparison, not segments
            auto m = rp.match_path("/apix");
            BOOST_TEST(m.matched);
            BOOST_TEST(m.rest == "x");
        }
        {
            auto m = rp.match_path("/ap");
            BOOST_TEST(! m.matched);
            BOOST_TEST(m.rest == "/ap");
        }
        {
            auto m = rp.match_path("/API");
            BOOST_TEST(! m.matched);
        }
        {
            route_pattern ci("/api", false);
            auto m = ci.match_path("/API/x");
            BOOST_TEST(m.matched);
            BOOST_TEST(m.rest == "/x");
        }
        {
            // the default pattern accepts everything
            route_pattern any;
            auto m = any.match("DELETE", "/x");
            BOOST_TEST(m.matched);
            BOOST_TEST(m.rest == "/x");
        }
    }

    void
    testMatchRegex()
    {
        {
            route_pattern rp("/users/<id:\\d+>");
            auto m = rp.match_path("/users/42/posts");
            BOOST_TEST(m.matched);
            BOOST_TEST(m.rest == "/posts");
            BOOST_TEST_EQ(m.params.size(), 1u);
            BOOST_TEST_EQ(m.params["id"], "42");

            m = rp.match_path("/users/bob");
            BOOST_TEST(! m.matched);
            BOOST_TEST(m.rest == "/users/bob");
            BOOST_TEST(m.params.empty());

            // anchored at the start of the path
            BOOST_TEST(! rp.match_path("/x/users/42").matched);
        }
        {
            route_pattern rp("/<a>/<b>");
            auto m = rp.match_path("/x/y/z");
            BOOST_TEST(m.matched);
            BOOST_TEST(m.rest == "/z");
            BOOST_TEST_EQ(m.params["a"], "x");
            BOOST_TEST_EQ(m.params["b"], "y");
        }
        {
            // nested angle brackets in the token regex
            route_pattern rp("/<v:(?<major>\\d+)\\.\\d+>");
            auto m = rp.match_path("/1.2/x");
            BOOST_TEST(m.matched);
            BOOST_TEST(m.rest == "/x");
            BOOST_TEST_EQ(m.params["v"], "1.2");
        }
        {
            // optional group which does not participate
            route_pattern rp("/a<x:(?:/b)?>");
            auto m = rp.match_path("/a");
            BOOST_TEST(m.matched);
            BOOST_TEST_EQ(m.params.size(), 1u);
            BOOST_TEST_EQ(m.params["x"], "");
        }
        {
            route_pattern rp("/exact$");
            BOOST_TEST(rp.match_path("/exact").matched);
            BOOST_TEST(! rp.match_path("/exact/").matched);
        }
        {
            // '$' never anchors before an embedded newline
            route_pattern rp("/x$");
            BOOST_TEST(rp.match_path("/x").matched);
            BOOST_TEST(! rp.match_path("/x\n/y").matched);

            route_pattern rp2("/<a>$");
            BOOST_TEST(! rp2.match_path("/b\n/c").matched);
            BOOST_TEST(rp2.match_path("/b\nc").matched);
        }
        {
            route_pattern rp("/Users/<id>", false);
            auto m = rp.match_path("/users/7");
            BOOST_TEST(m.matched);
            BOOST_TEST_EQ(m.params["id"], "7");
        }
    }

    void
    testMatchMethod()
    {
        route_pattern rp("GET,HEAD /x");
        BOOST_TEST(rp.match("GET", "/x").matched);
        BOOST_TEST(rp.match("HEAD", "/x/y").matched);
        {
            auto m = rp.match("POST", "/x");
            BOOST_TEST(! m.matched);
            BOOST_TEST(m.rest == "/x");
        }
        BOOST_TEST(! rp.match("get", "/x").matched);
        BOOST_TEST(! rp.match("GET", "/y").matched);

        route_pattern any("/x");
        BOOST_TEST(any.match("PURGE", "/x").matched);
    }

    // prefix comparison must agree with the
    // regex engine on every input
    void
    testLiteralParity()
    {
        char const* const patterns[] = {
            "", "/", "/api", "/api/", "/a-b_c~", "/a b", "/%7e" };
        char const* const paths[] = {
            "", "/", "/a", "/api", "/api/", "/api/v1", "/apix",
            "/API", "/a-b_c~/x", "/a b", "/a bc", "/%7e", "x/api" };
        for(bool cs : { true, false })
        {
            for(auto pat : patterns)
            {
                route_pattern lit(pat, cs);
                BOOST_TEST(lit.is_literal());

                // same text, forced through the regex engine
                route_pattern re(
                    std::string("(?:") + pat + ")", cs);
                BOOST_TEST(! re.is_literal());

                for(auto path : paths)
                {
                    auto m0 = lit.match_path(path);
                    auto m1 = re.match_path(path);
                    BOOST_TEST_EQ(m0.matched, m1.matched);
                    BOOST_TEST(m0.rest == m1.rest);
                }
            }
        }
    }

    // consumed prefix plus remainder is the input
    void
    testRoundTrip()
    {
        char const* const patterns[] = {
            "/api", "/<seg>", "/users/<id:\\d+>", ".*", "/a+" };
        char const* const paths[] = {
            "/api/v1", "/users/42/x", "/aaa/b", "/", "" };
        for(auto pat : patterns)
        {
            route_pattern rp(pat);
            for(std::string_view path : paths)
            {
                auto m = rp.match_path(path);
                if(! m.matched)
                {
                    BOOST_TEST(m.rest == path);
                    continue;
                }
                BOOST_TEST(m.rest.size() <= path.size());
                auto const consumed = path.substr(
                    0, path.size() - m.rest.size());
                BOOST_TEST_EQ(
                    std::string(consumed) + std::string(m.rest),
                    std::string(path));
                BOOST_TEST(path.substr(consumed.size()) == m.rest);
            }
        }
    }

    void
    run()
    {
        testParse();
        testMatchLiteral();
        testMatchRegex();
        testMatchMethod();
        testLiteralParity();
        testRoundTrip();
    }
};

} // routekit

int
main()
{
    routekit::route_pattern_test{}.run();
    return boost::report_errors();
}
