#include <provenance/schema/encoding/scale/add_authorized_actor.hpp>
#include <provenance/schema/encoding/scale/add_tracking_event.hpp>
#include <provenance/schema/encoding/scale/add_tracking_events_batch.hpp>
#include <provenance/schema/encoding/scale/primitives.hpp>
#include <provenance/schema/encoding/scale/register_event_type.hpp>
#include <provenance/schema/encoding/scale/register_product.hpp>
#include <provenance/schema/encoding/scale/remove_authorized_actor.hpp>
#include <provenance/schema/encoding/scale/set_product_active.hpp>
#include <provenance/schema/encoding/scale/transaction.hpp>
#include <provenance/schema/encoding/scale/transfer_ownership.hpp>

namespace provenance::schema {

// The signature is the trailing field so the signed message is exactly the
// encoding of everything before it.
void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace provenance::schema
