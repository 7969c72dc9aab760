#pragma once

namespace stablecore::tests {

void test_oracle_normalization();
void test_oracle_staleness();

}  // namespace stablecore::tests
