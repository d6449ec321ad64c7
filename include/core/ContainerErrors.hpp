// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#ifndef ADAPTIVE_CONTAINER_ERRORS_HPP
#define ADAPTIVE_CONTAINER_ERRORS_HPP

#include <stdexcept>

namespace Adaptive::Core {

    class ContainerError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Storage vagy engine setup hiba; a konténer UNINITIALIZED marad.
    class InitializationError : public ContainerError {
    public:
        using ContainerError::ContainerError;
    };

    class StorageError : public ContainerError {
    public:
        using ContainerError::ContainerError;
    };

    class EngineError : public ContainerError {
    public:
        using ContainerError::ContainerError;
    };

    // A DataSource streamje megszakadt; az observation task véget ér.
    class ObservationError : public ContainerError {
    public:
        using ContainerError::ContainerError;
    };

    // Művelet a lifecycle-nek nem megfelelő állapotban (programozói hiba).
    class LifecycleError : public ContainerError {
    public:
        using ContainerError::ContainerError;
    };
}

#endif
