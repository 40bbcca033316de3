#include <gtest/gtest.h>
#include <provenance/execution/authorization.hpp>
#include <provenance/testing/common.hpp>

namespace {

using provenance::schema::transaction_error_code;
using provenance::testing::make_named_signer;

provenance::schema::product_state_t make_product() {
  auto product = provenance::schema::product_state_t{};
  product.product_id = "COFFEE-001";
  product.owner = make_named_signer(1);
  product.authorized_actors = {make_named_signer(1), make_named_signer(2)};
  return product;
}

}  // namespace

TEST(authorization, owner_and_actors_may_append) {
  auto product = make_product();
  EXPECT_FALSE(provenance::execution::check_write_access(product,
                                                         make_named_signer(1))
                   .has_value());
  EXPECT_FALSE(provenance::execution::check_write_access(product,
                                                         make_named_signer(2))
                   .has_value());
  EXPECT_EQ(
      provenance::execution::check_write_access(product, make_named_signer(3)),
      std::optional{transaction_error_code::authorization_denied});
}

TEST(authorization, only_owner_passes_owner_check) {
  auto product = make_product();
  EXPECT_FALSE(
      provenance::execution::check_owner(product, make_named_signer(1))
          .has_value());
  EXPECT_EQ(provenance::execution::check_owner(product, make_named_signer(2)),
            std::optional{transaction_error_code::authorization_denied});
}

TEST(authorization, actor_membership_is_exact) {
  auto product = make_product();
  EXPECT_TRUE(
      provenance::execution::is_authorized_actor(product, make_named_signer(2)));
  auto ed25519 = provenance::schema::ed25519_signer_id{};
  ed25519.public_key[0] = 2;
  EXPECT_FALSE(provenance::execution::is_authorized_actor(
      product, provenance::schema::signer_id_t{ed25519}));
}
