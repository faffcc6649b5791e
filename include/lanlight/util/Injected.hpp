// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <functional>
#include <memory>

namespace lanlight
{
namespace util
{

// Holder used to inject collaborators into components. A component
// written against Injected<T> does not care whether it owns its
// collaborator, refers to one owned elsewhere or shares ownership.

// Owned value
template <typename T>
struct Injected
{
  using type = T;

  Injected(T t)
    : val(std::move(t))
  {
  }

  T& get()
  {
    return val;
  }

  const T& get() const
  {
    return val;
  }

  T* operator->()
  {
    return &get();
  }

  const T* operator->() const
  {
    return &get();
  }

  T& operator*()
  {
    return get();
  }

  const T& operator*() const
  {
    return get();
  }

  T val;
};

template <typename T>
Injected<T> injectVal(T t)
{
  return {std::move(t)};
}

// Reference to an object owned by someone else, who must keep it
// alive for as long as the injected reference is in use.
template <typename T>
struct Injected<T&>
{
  using type = T;

  Injected(T& t)
    : ref(t)
  {
  }

  T& get() const
  {
    return ref.get();
  }

  T* operator->() const
  {
    return &get();
  }

  T& operator*() const
  {
    return get();
  }

  std::reference_wrapper<T> ref;
};

template <typename T>
Injected<T&> injectRef(T& t)
{
  return {t};
}

// Shared ownership
template <typename T>
struct Injected<std::shared_ptr<T>>
{
  using type = T;

  Injected(std::shared_ptr<T> pT)
    : shared(std::move(pT))
  {
  }

  T& get() const
  {
    return *shared;
  }

  T* operator->() const
  {
    return shared.get();
  }

  T& operator*() const
  {
    return get();
  }

  std::shared_ptr<T> shared;
};

template <typename T>
Injected<std::shared_ptr<T>> injectShared(std::shared_ptr<T> shared)
{
  return {std::move(shared)};
}

// Unique ownership of an object that can't be moved itself, such as
// an io service running its own thread.
template <typename T>
struct Injected<std::unique_ptr<T>>
{
  using type = T;

  Injected(std::unique_ptr<T> pT)
    : unique(std::move(pT))
  {
  }

  T& get() const
  {
    return *unique;
  }

  T* operator->() const
  {
    return unique.get();
  }

  T& operator*() const
  {
    return get();
  }

  std::unique_ptr<T> unique;
};

template <typename T>
Injected<std::unique_ptr<T>> injectUnique(std::unique_ptr<T> unique)
{
  return {std::move(unique)};
}

} // namespace util
} // namespace lanlight
