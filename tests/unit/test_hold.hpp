#pragma once

namespace escrowcore::tests {

void test_hold_place_and_capture();
void test_hold_partial_release();
void test_hold_concurrent_placement();
void test_hold_expiry();
void test_hold_split_single_posting();
void test_hold_extension();

}  // namespace escrowcore::tests
