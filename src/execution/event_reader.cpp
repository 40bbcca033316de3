#include <spdlog/fmt/fmt.h>
#include <provenance/common/critical.hpp>
#include <provenance/execution/event_reader.hpp>
#include <provenance/schema/key/engine_keys.hpp>

#include <algorithm>
#include <utility>

namespace provenance::execution {

bool matches(const provenance::schema::event_filter_t& filter,
             const provenance::schema::tracking_event_t& event) {
  if (filter.event_type && event.event_type != filter.event_type.value()) {
    return false;
  }
  if (filter.start_time && event.timestamp < filter.start_time.value()) {
    return false;
  }
  if (filter.end_time && event.timestamp > filter.end_time.value()) {
    return false;
  }
  return !filter.location || event.location == filter.location.value();
}

event_reader::event_reader(encoder_t& encoder,
                           const storage_t& storage,
                           event_log log,
                           provenance::schema::product_id_t product_id,
                           uint64_t from,
                           uint64_t to)
    : encoder_{&encoder},
      storage_{&storage},
      log_{log},
      product_id_{std::move(product_id)},
      from_{std::min(from, to)},
      to_{to} {}

event_reader::iterator event_reader::begin() const {
  return iterator{this, from_};
}

event_reader::iterator event_reader::end() const {
  return iterator{this, to_};
}

provenance::schema::bytes_t event_reader::key_for(uint64_t sequence) const {
  if (log_ == event_log::governance) {
    return provenance::schema::key::make_governance_key(*encoder_, product_id_,
                                                        sequence);
  }
  return provenance::schema::key::make_event_key(*encoder_, product_id_,
                                                 sequence);
}

std::optional<provenance::schema::tracking_event_t> event_reader::at(
    uint64_t sequence) const {
  if (sequence < from_ || sequence >= to_) {
    return std::nullopt;
  }
  auto key = key_for(sequence);
  return storage_->get<provenance::schema::tracking_event_t>(
      *encoder_, provenance::schema::make_bytes_view(key));
}

event_reader::iterator::iterator(const event_reader* reader, uint64_t sequence)
    : reader_{reader}, sequence_{sequence} {
  load();
}

void event_reader::iterator::load() {
  current_.reset();
  if (reader_ == nullptr || sequence_ >= reader_->to_) {
    return;
  }
  current_ = reader_->at(sequence_);
  if (!current_) {
    // Every sequence below a committed counter was written in the same batch
    // as the counter itself.
    provenance::common::critical(
        "event log is missing a committed sequence",
        fmt::format("product '{}' sequence {}", reader_->product_id_,
                    sequence_));
  }
}

event_reader::iterator::reference event_reader::iterator::operator*() const {
  return current_.value();
}

event_reader::iterator::pointer event_reader::iterator::operator->() const {
  return &current_.value();
}

event_reader::iterator& event_reader::iterator::operator++() {
  ++sequence_;
  load();
  return *this;
}

void event_reader::iterator::operator++(int) {
  ++*this;
}

bool event_reader::iterator::operator==(const iterator& other) const {
  return sequence_ == other.sequence_;
}

}  // namespace provenance::execution
