#pragma once

namespace stablecore::tests {

void test_request_codec();
void test_parse_command();
void test_dispatch();

}  // namespace stablecore::tests
