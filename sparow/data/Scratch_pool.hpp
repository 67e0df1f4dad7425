#pragma once

//
// ... Standard header files
//
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

//
// ... sparow header files
//
#include <sparow/config.hpp>
#include <sparow/data/Pool_config.hpp>
#include <sparow/data/Sparse_row.hpp>
#include <sparow/data/errors.hpp>

namespace sparow::data::detail {

  /**
   * @brief Process-wide, fixed-size pool of reusable row buffers.
   *
   * Sparse_matrix::dot borrows one buffer per call to hold the column it
   * is currently extracting, so no allocation happens inside the product
   * loop once the buffer has grown to the column length. borrow() blocks
   * while every buffer is outstanding, so the pool also bounds the number
   * of concurrent products to the number of buffers.
   *
   * The pool is inert until initialize() is called. It can be
   * re-initialized or torn down only while no buffer is outstanding, so
   * outstanding plus resting buffers always equals capacity().
   *
   * There is one pool per value type.
   */
  template <typename T = config::value_type>
  class Scratch_pool final {
  public:
    using size_type = config::size_type;
    using buffer_type = Sparse_row<T>;

    /**
     * @brief Scoped ownership of one borrowed buffer.
     *
     * The buffer is truncated and returned to the pool when the lease is
     * destroyed, including during stack unwinding.
     */
    class Lease final {
    public:
      Lease(Lease const&) = delete;
      Lease&
      operator=(Lease const&) = delete;

      Lease(Lease&& input) noexcept
          : pool_(std::exchange(input.pool_, nullptr))
          , buffer_(std::move(input.buffer_)) {}

      Lease&
      operator=(Lease&& input) noexcept {
        if (this != &input) {
          give_back();
          pool_ = std::exchange(input.pool_, nullptr);
          buffer_ = std::move(input.buffer_);
        }
        return *this;
      }

      ~Lease() { give_back(); }

      buffer_type&
      buffer() {
        return buffer_;
      }

      buffer_type const&
      buffer() const {
        return buffer_;
      }

    private:
      friend class Scratch_pool;

      Lease(Scratch_pool* pool, buffer_type buffer)
          : pool_(pool), buffer_(std::move(buffer)) {}

      void
      give_back() noexcept {
        if (pool_) {
          pool_->release(std::move(buffer_));
          pool_ = nullptr;
        }
      }

      Scratch_pool* pool_;
      buffer_type buffer_;

    }; // end of class Lease

    Scratch_pool(Scratch_pool const&) = delete;
    Scratch_pool&
    operator=(Scratch_pool const&) = delete;

    static Scratch_pool&
    instance() {
      static Scratch_pool pool;
      return pool;
    }

    /**
     * @brief Allocate @p config.buffers buffers, each reserved to
     *        @p config.buffer_length elements.
     *
     * @throws Zero_length_error if @p config.buffers is less than one.
     * @throws std::invalid_argument if @p config.buffer_length is negative.
     * @throws std::logic_error if a buffer is currently outstanding.
     */
    void
    initialize(Pool_config const& config) {
      if (config.buffers < 1) {
        throw Zero_length_error();
      }
      if (config.buffer_length < 0) {
        throw std::invalid_argument("scratch pool: negative buffer length");
      }

      std::lock_guard<std::mutex> lock(mutex_);
      if (outstanding_ != 0) {
        throw std::logic_error("scratch pool: cannot initialize while buffers are outstanding");
      }

      resting_.clear();
      resting_.reserve(static_cast<std::size_t>(config.buffers));
      for (size_type i = 0; i < config.buffers; ++i) {
        buffer_type buffer;
        buffer.reserve(config.buffer_length);
        resting_.push_back(std::move(buffer));
      }
      config_ = config;
      initialized_ = true;
    }

    void
    initialize(size_type buffers, size_type buffer_length) {
      initialize(Pool_config{buffers, buffer_length});
    }

    /**
     * @brief Release every buffer and return the pool to its inert state.
     *
     * @throws std::logic_error if a buffer is currently outstanding.
     */
    void
    teardown() {
      std::lock_guard<std::mutex> lock(mutex_);
      if (outstanding_ != 0) {
        throw std::logic_error("scratch pool: cannot tear down while buffers are outstanding");
      }
      resting_.clear();
      resting_.shrink_to_fit();
      initialized_ = false;
    }

    /**
     * @brief Take a buffer, waiting until one is returned if none rests
     *        in the pool. The buffer is empty.
     *
     * @throws std::logic_error if the pool is not initialized.
     */
    Lease
    borrow() {
      std::unique_lock<std::mutex> lock(mutex_);
      if (!initialized_) {
        throw std::logic_error("scratch pool: borrow before initialize");
      }
      returned_.wait(lock, [this] { return !resting_.empty(); });

      buffer_type buffer = std::move(resting_.back());
      resting_.pop_back();
      ++outstanding_;
      return Lease(this, std::move(buffer));
    }

    /**
     * @brief Truncate @p buffer to length zero and put it back.
     *
     * Called by Lease; the allocation of the buffer is kept for reuse.
     */
    void
    release(buffer_type buffer) noexcept {
      buffer.clear();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        resting_.push_back(std::move(buffer));
        --outstanding_;
      }
      returned_.notify_one();
    }

    bool
    initialized() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return initialized_;
    }

    /// @brief The configured number of buffers; zero when inert.
    size_type
    capacity() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return initialized_ ? config_.buffers : 0;
    }

    /// @brief The number of buffers resting in the pool.
    size_type
    available() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return static_cast<size_type>(resting_.size());
    }

    size_type
    outstanding() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return outstanding_;
    }

    size_type
    buffer_length() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return config_.buffer_length;
    }

  private:
    Scratch_pool() = default;

    mutable std::mutex mutex_;
    std::condition_variable returned_;
    std::vector<buffer_type> resting_;
    Pool_config config_{};
    size_type outstanding_{0};
    bool initialized_{false};

  }; // end of class Scratch_pool

  /**
   * @brief Initialize the pool serving the default value type.
   */
  inline void
  initialize_scratch_pool(Pool_config const& config = Pool_config{}) {
    Scratch_pool<>::instance().initialize(config);
  }

  inline void
  teardown_scratch_pool() {
    Scratch_pool<>::instance().teardown();
  }

} // end of namespace sparow::data::detail
