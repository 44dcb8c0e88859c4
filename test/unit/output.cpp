//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <routekit/output.hpp>

#include "test_helpers.hpp"
#include <boost/core/lightweight_test.hpp>
#include <boost/system/errc.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace routekit {

struct output_test
{
    void
    testBytes()
    {
        auto const write = [](output_value const& v)
        {
            test::string_sink s;
            auto ec = write_output(s, v);
            BOOST_TEST(! ec.failed());
            return s.body;
        };

        BOOST_TEST_EQ(write(output_value()), "");
        BOOST_TEST_EQ(write(std::string("hello")), "hello");
        BOOST_TEST_EQ(write(std::vector<unsigned char>{
            'a', 0, 'b' }), std::string("a\0b", 3));
        BOOST_TEST_EQ(write(true), "true");
        BOOST_TEST_EQ(write(false), "false");
        BOOST_TEST_EQ(write(std::int64_t(-42)), "-42");
        BOOST_TEST_EQ(write(1.5), "1.5");
    }

    void
    testEmpty()
    {
        // no output never touches the sink
        test::string_sink s;
        BOOST_TEST(! write_output(s, output_value()).failed());
        BOOST_TEST_EQ(s.writes, 0u);

        test::value_sink vs;
        BOOST_TEST(! write_output(vs, output_value()).failed());
        BOOST_TEST(vs.values.empty());
    }

    void
    testDataWriter()
    {
        // a data writer takes precedence over bytes
        test::value_sink s;
        BOOST_TEST(! write_output(s, std::string("x")).failed());
        BOOST_TEST(! write_output(s, std::int64_t(7)).failed());
        BOOST_TEST(s.body.empty());
        BOOST_TEST_EQ(s.writes, 0u);
        if(BOOST_TEST_EQ(s.values.size(), 2u))
        {
            BOOST_TEST(std::get<std::string>(s.values[0]) == "x");
            BOOST_TEST(std::get<std::int64_t>(s.values[1]) == 7);
        }
    }

    void
    testFailure()
    {
        auto const ec0 = system::errc::make_error_code(
            system::errc::broken_pipe);
        {
            test::string_sink s;
            s.fail_with = ec0;
            BOOST_TEST(write_output(s, std::string("x")) == ec0);
            BOOST_TEST(write_output(s, 3.25) == ec0);
        }
        {
            test::value_sink s;
            s.data_fail_with = ec0;
            BOOST_TEST(write_output(s, std::string("x")) == ec0);
            BOOST_TEST(s.values.empty());
        }
    }

    void
    run()
    {
        testBytes();
        testEmpty();
        testDataWriter();
        testFailure();
    }
};

} // routekit

int
main()
{
    routekit::output_test{}.run();
    return boost::report_errors();
}
