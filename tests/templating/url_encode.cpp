/// @file url_encode.cpp
/// @brief url_encode formatter behaviour

#include "easymcp/templating/formatter.hpp"
#include "easymcp/templating/template.hpp"

#include <cassert>
#include <iostream>

using namespace easymcp;
using namespace easymcp::templating;

void test_encodes_reserved()
{
    std::cout << "  test_encodes_reserved... " << std::flush;
    assert(url_encode("hello world & more") == "hello%20world%20%26%20more");
    assert(url_encode("a/b?c=d#e") == "a%2Fb%3Fc%3Dd%23e");
    assert(url_encode("") == "");
    std::cout << "PASSED\n";
}

void test_unreserved_untouched()
{
    std::cout << "  test_unreserved_untouched... " << std::flush;
    const std::string unreserved =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_.~";
    assert(url_encode(unreserved) == unreserved);
    std::cout << "PASSED\n";
}

void test_utf8_bytes()
{
    std::cout << "  test_utf8_bytes... " << std::flush;
    // "é" is C3 A9 in UTF-8
    assert(url_encode("caf\xC3\xA9") == "caf%C3%A9");
    std::cout << "PASSED\n";
}

void test_not_idempotent()
{
    std::cout << "  test_not_idempotent... " << std::flush;
    auto once = url_encode("hello world");
    auto twice = url_encode(once);
    assert(once == "hello%20world");
    assert(twice == "hello%2520world");
    std::cout << "PASSED\n";
}

void test_formatter_stringifies_values()
{
    std::cout << "  test_formatter_stringifies_values... " << std::flush;
    const Formatter* f = default_formatters().find("url_encode");
    assert(f != nullptr);
    assert((*f)(Json(12)) == "12");
    assert((*f)(Json(false)) == "false");
    assert((*f)(Json{{"a", 1}}) == "%7B%22a%22%3A1%7D");
    assert(render("{ input.q | url_encode }", Json{{"input", {{"q", "hello world & more"}}}}) ==
           "hello%20world%20%26%20more");
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "url_encode tests\n";
    test_encodes_reserved();
    test_unreserved_untouched();
    test_utf8_bytes();
    test_not_idempotent();
    test_formatter_stringifies_values();
    std::cout << "All url_encode tests passed\n";
    return 0;
}
