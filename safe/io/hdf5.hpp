#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/core/macros.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#ifdef SAFE_HAS_HDF5
#include <hdf5.h>

// =============================================================================
// FILE: safe/io/hdf5.hpp
// BRIEF: RAII wrapper over the HDF5 C API
//
// Covers what result export needs: files, groups, simple datasets of
// numeric or variable-length string type, and scalar attributes.
// =============================================================================

namespace safe::io::h5 {

namespace detail {

template <typename T>
inline hid_t native_type() {
    if constexpr (std::is_same_v<T, float>)         return H5T_NATIVE_FLOAT;
    else if constexpr (std::is_same_v<T, double>)   return H5T_NATIVE_DOUBLE;
    else if constexpr (std::is_same_v<T, int8_t>)   return H5T_NATIVE_INT8;
    else if constexpr (std::is_same_v<T, int32_t>)  return H5T_NATIVE_INT32;
    else if constexpr (std::is_same_v<T, int64_t>)  return H5T_NATIVE_INT64;
    else if constexpr (std::is_same_v<T, uint8_t>)  return H5T_NATIVE_UINT8;
    else if constexpr (std::is_same_v<T, uint64_t>) return H5T_NATIVE_UINT64;
    else static_assert(sizeof(T) == 0, "Unsupported HDF5 type");
}

inline void check_h5(herr_t err, const std::string& context) {
    if (err < 0) {
        std::string msg = "HDF5: " + context;

        struct ErrorWalker {
            std::string* msg;
        } walker{&msg};

        herr_t walk_err = H5Ewalk2(H5E_DEFAULT, H5E_WALK_DOWNWARD,
            [](unsigned, const H5E_error2_t* err, void* data) -> herr_t {
                auto* w = static_cast<ErrorWalker*>(data);
                if (err->desc) {
                    *w->msg += "\n  " + std::string(err->desc);
                }
                return 0;
            }, &walker);

        if (walk_err < 0) {
            msg += " (failed to retrieve error details)";
        }

        throw IOError(msg);
    }
}

inline void check_id(hid_t id, const std::string& context) {
    if (id < 0) {
        throw IOError("HDF5 invalid ID: " + context);
    }
}

} // namespace detail

// =============================================================================
// Object - owning handle
// =============================================================================

class Object {
protected:
    hid_t _id;
    herr_t (*_closer)(hid_t);

    Object(hid_t id, herr_t (*closer)(hid_t)) noexcept
        : _id(id), _closer(closer) {}

    Object() noexcept : _id(H5I_INVALID_HID), _closer(nullptr) {}

public:
    virtual ~Object() noexcept { close(); }

    void close() noexcept {
        if (is_valid() && _closer) {
            _closer(_id);
            _id = H5I_INVALID_HID;
        }
    }

    Object(Object&& other) noexcept
        : _id(other._id), _closer(other._closer)
    {
        other._id = H5I_INVALID_HID;
        other._closer = nullptr;
    }

    Object& operator=(Object&& other) noexcept {
        if (this != &other) {
            close();
            _id = other._id;
            _closer = other._closer;
            other._id = H5I_INVALID_HID;
            other._closer = nullptr;
        }
        return *this;
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    SAFE_NODISCARD hid_t id() const noexcept { return _id; }

    SAFE_NODISCARD bool is_valid() const noexcept {
        return _id >= 0 && _id != H5I_INVALID_HID;
    }
};

// =============================================================================
// Dataspace / Datatype
// =============================================================================

class Dataspace : public Object {
public:
    explicit Dataspace(const std::vector<hsize_t>& dims)
        : Object(H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr), H5Sclose)
    {
        detail::check_id(_id, "H5Screate_simple");
    }

    static Dataspace scalar() {
        hid_t id = H5Screate(H5S_SCALAR);
        detail::check_id(id, "H5Screate(SCALAR)");
        return Dataspace(id);
    }

    static Dataspace of(hid_t dataset_id) {
        hid_t id = H5Dget_space(dataset_id);
        detail::check_id(id, "H5Dget_space");
        return Dataspace(id);
    }

    std::vector<hsize_t> dims() const {
        const int rank = H5Sget_simple_extent_ndims(_id);
        if (rank < 0) return {};
        std::vector<hsize_t> d(static_cast<size_t>(rank));
        detail::check_h5(H5Sget_simple_extent_dims(_id, d.data(), nullptr), "H5Sget_simple_extent_dims");
        return d;
    }

    hsize_t num_elements() const {
        const hssize_t n = H5Sget_simple_extent_npoints(_id);
        if (n < 0) throw IOError("HDF5: H5Sget_simple_extent_npoints failed");
        return static_cast<hsize_t>(n);
    }

private:
    explicit Dataspace(hid_t id) : Object(id, H5Sclose) {}
};

class Datatype : public Object {
public:
    static Datatype string_vlen() {
        hid_t id = H5Tcopy(H5T_C_S1);
        detail::check_id(id, "H5Tcopy(H5T_C_S1)");
        Datatype t(id);
        detail::check_h5(H5Tset_size(id, H5T_VARIABLE), "H5Tset_size");
        detail::check_h5(H5Tset_cset(id, H5T_CSET_UTF8), "H5Tset_cset");
        return t;
    }

    static Datatype string_fixed(size_t len) {
        hid_t id = H5Tcopy(H5T_C_S1);
        detail::check_id(id, "H5Tcopy(H5T_C_S1)");
        Datatype t(id);
        detail::check_h5(H5Tset_size(id, len), "H5Tset_size");
        return t;
    }

private:
    explicit Datatype(hid_t id) : Object(id, H5Tclose) {}
};

// =============================================================================
// Dataset
// =============================================================================

class Dataset : public Object {
public:
    Dataset(hid_t loc_id, const std::string& name)
        : Object(H5Dopen2(loc_id, name.c_str(), H5P_DEFAULT), H5Dclose)
    {
        detail::check_id(_id, "H5Dopen: " + name);
    }

    static Dataset create(hid_t loc_id, const std::string& name, hid_t type_id, const Dataspace& space) {
        hid_t id = H5Dcreate2(loc_id, name.c_str(), type_id, space.id(),
                              H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Dcreate: " + name);
        return Dataset(id);
    }

    std::vector<hsize_t> dims() const { return Dataspace::of(_id).dims(); }

    template <typename T>
    void write(const T* buffer) {
        detail::check_h5(
            H5Dwrite(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer),
            "H5Dwrite");
    }

    void write_strings(const std::vector<std::string>& values) {
        std::vector<const char*> ptrs(values.size());
        for (size_t i = 0; i < values.size(); ++i) {
            ptrs[i] = values[i].c_str();
        }
        Datatype dtype = Datatype::string_vlen();
        detail::check_h5(
            H5Dwrite(_id, dtype.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, ptrs.data()),
            "H5Dwrite strings");
    }

    template <typename T>
    std::vector<T> read_vector() const {
        std::vector<T> out(static_cast<size_t>(Dataspace::of(_id).num_elements()));
        detail::check_h5(
            H5Dread(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()),
            "H5Dread");
        return out;
    }

    std::vector<std::string> read_strings() const {
        Dataspace space = Dataspace::of(_id);
        std::vector<char*> ptrs(static_cast<size_t>(space.num_elements()), nullptr);
        Datatype dtype = Datatype::string_vlen();
        detail::check_h5(
            H5Dread(_id, dtype.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, ptrs.data()),
            "H5Dread strings");

        std::vector<std::string> out;
        out.reserve(ptrs.size());
        for (char* p : ptrs) {
            out.emplace_back(p ? p : "");
        }
        detail::check_h5(H5Dvlen_reclaim(dtype.id(), space.id(), H5P_DEFAULT, ptrs.data()),
                         "H5Dvlen_reclaim");
        return out;
    }

private:
    explicit Dataset(hid_t id) : Object(id, H5Dclose) {}
};

// =============================================================================
// Location - files and groups
// =============================================================================

class Location : public Object {
public:
    template <typename T>
    void write_dataset(const std::string& name, const T* data, const std::vector<hsize_t>& dims) {
        Dataset dset = Dataset::create(_id, name, detail::native_type<T>(), Dataspace(dims));
        dset.write(data);
    }

    template <typename T>
    void write_dataset(const std::string& name, const std::vector<T>& data) {
        write_dataset(name, data.data(), {static_cast<hsize_t>(data.size())});
    }

    void write_strings(const std::string& name, const std::vector<std::string>& values) {
        Datatype dtype = Datatype::string_vlen();
        Dataset dset = Dataset::create(_id, name, dtype.id(),
                                       Dataspace(std::vector<hsize_t>{static_cast<hsize_t>(values.size())}));
        dset.write_strings(values);
    }

    template <typename T>
    void write_attribute(const std::string& name, const T& value) {
        Dataspace space = Dataspace::scalar();
        hid_t attr = H5Acreate2(_id, name.c_str(), detail::native_type<T>(), space.id(),
                                H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(attr, "H5Acreate: " + name);
        const herr_t err = H5Awrite(attr, detail::native_type<T>(), &value);
        H5Aclose(attr);
        detail::check_h5(err, "H5Awrite: " + name);
    }

    void write_attribute(const std::string& name, const std::string& value) {
        Dataspace space = Dataspace::scalar();
        Datatype dtype = Datatype::string_fixed(value.size() + 1);
        hid_t attr = H5Acreate2(_id, name.c_str(), dtype.id(), space.id(), H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(attr, "H5Acreate: " + name);
        const herr_t err = H5Awrite(attr, dtype.id(), value.c_str());
        H5Aclose(attr);
        detail::check_h5(err, "H5Awrite: " + name);
    }

    template <typename T>
    T read_attribute(const std::string& name) const {
        hid_t attr = H5Aopen(_id, name.c_str(), H5P_DEFAULT);
        detail::check_id(attr, "H5Aopen: " + name);
        T value{};
        const herr_t err = H5Aread(attr, detail::native_type<T>(), &value);
        H5Aclose(attr);
        detail::check_h5(err, "H5Aread: " + name);
        return value;
    }

    Dataset open_dataset(const std::string& name) const {
        return Dataset(_id, name);
    }

    bool exists(const std::string& name) const {
        return H5Lexists(_id, name.c_str(), H5P_DEFAULT) > 0;
    }

protected:
    using Object::Object;
    Location() = default;
};

class Group : public Location {
public:
    Group(hid_t loc_id, const std::string& name)
        : Location(H5Gopen2(loc_id, name.c_str(), H5P_DEFAULT), H5Gclose)
    {
        detail::check_id(_id, "H5Gopen: " + name);
    }

    static Group create(hid_t loc_id, const std::string& name) {
        hid_t id = H5Gcreate2(loc_id, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Gcreate: " + name);
        return Group(id);
    }

private:
    explicit Group(hid_t id) : Location(id, H5Gclose) {}
};

class File : public Location {
public:
    explicit File(const std::string& path, unsigned flags = H5F_ACC_RDONLY)
        : Location(H5Fopen(path.c_str(), flags, H5P_DEFAULT), H5Fclose)
    {
        if (_id < 0) {
            throw FileNotFoundError(path);
        }
    }

    static File create(const std::string& path, unsigned flags = H5F_ACC_TRUNC) {
        hid_t id = H5Fcreate(path.c_str(), flags, H5P_DEFAULT, H5P_DEFAULT);
        if (id < 0) {
            throw WriteError("HDF5: cannot create " + path);
        }
        return File(id);
    }

    Group create_group(const std::string& name) { return Group::create(_id, name); }
    Group open_group(const std::string& name) const { return Group(_id, name); }

    void flush() {
        detail::check_h5(H5Fflush(_id, H5F_SCOPE_GLOBAL), "H5Fflush");
    }

private:
    explicit File(hid_t id) : Location(id, H5Fclose) {}
};

} // namespace safe::io::h5

#endif // SAFE_HAS_HDF5
