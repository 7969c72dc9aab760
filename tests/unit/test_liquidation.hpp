#pragma once

namespace stablecore::tests {

void test_liquidation_quote();
void test_liquidation_partial_and_full();
void test_liquidation_rejections();
void test_liquidator_must_stay_solvent();

}  // namespace stablecore::tests
