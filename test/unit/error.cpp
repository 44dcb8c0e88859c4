//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <routekit/error.hpp>

#include <boost/core/lightweight_test.hpp>
#include <cstring>
#include <memory>
#include <system_error>

namespace routekit {

struct error_test
{
    void
    check(error e)
    {
        system::error_code ec = e;
        BOOST_TEST(std::strcmp(ec.category().name(), "routekit") == 0);
        BOOST_TEST(! ec.message().empty());
        BOOST_TEST(ec.message() != "unknown");
        BOOST_TEST(std::addressof(ec.category()) ==
            std::addressof(make_error_code(e).category()));
        BOOST_TEST(ec.failed());
        BOOST_TEST(ec == e);
    }

    void
    testCodes()
    {
        check(error::invalid_method);
        check(error::invalid_pattern);
        check(error::duplicate_param);
        check(error::invalid_regex);
        check(error::unhandled_exception);

        system::error_code ec = error::success;
        BOOST_TEST(! ec.failed());
    }

    void
    testStd()
    {
        std::error_code ec = error::invalid_regex;
        BOOST_TEST(ec.failed());
        BOOST_TEST_EQ(ec.message(),
            std::string("invalid regular expression"));
    }

    void
    testSourceLocation()
    {
        system::error_code ec = ROUTEKIT_ERR(
            error::invalid_pattern);
        BOOST_TEST(ec == error::invalid_pattern);
        BOOST_TEST(ec.has_location());
    }

    void
    run()
    {
        testCodes();
        testStd();
        testSourceLocation();
    }
};

} // routekit

int
main()
{
    routekit::error_test{}.run();
    return boost::report_errors();
}
