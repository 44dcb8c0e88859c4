//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <routekit/method.hpp>

#include <boost/core/lightweight_test.hpp>

namespace routekit {

struct method_test
{
    void
    testStrings()
    {
        auto const check = [](method m)
        {
            BOOST_TEST(string_to_method(to_string(m)) == m);
        };
        check(method::delete_);
        check(method::get);
        check(method::head);
        check(method::post);
        check(method::put);
        check(method::connect);
        check(method::options);
        check(method::trace);
        check(method::patch);

        BOOST_TEST(string_to_method("") == method::unknown);
        BOOST_TEST(string_to_method("get") == method::unknown);
        BOOST_TEST(string_to_method("PURGE") == method::unknown);
        BOOST_TEST(to_string(method::delete_) == "DELETE");
    }

    void
    testSet()
    {
        {
            method_set s;
            BOOST_TEST(s.empty());
            BOOST_TEST(! s.contains("GET"));
        }
        {
            method_set s;
            s.insert("GET");
            s.insert("HEAD");
            BOOST_TEST(! s.empty());
            BOOST_TEST(s.contains("GET"));
            BOOST_TEST(s.contains("HEAD"));
            BOOST_TEST(! s.contains("POST"));
            BOOST_TEST(! s.contains("get"));
        }
        {
            // methods outside the known list
            method_set s;
            s.insert("PURGE");
            BOOST_TEST(! s.empty());
            BOOST_TEST(s.contains("PURGE"));
            BOOST_TEST(! s.contains("GET"));
            BOOST_TEST(! s.contains("purge"));

            s.insert("PURGE");
            BOOST_TEST(s.contains("PURGE"));
        }
    }

    void
    run()
    {
        testStrings();
        testSet();
    }
};

} // routekit

int
main()
{
    routekit::method_test{}.run();
    return boost::report_errors();
}
