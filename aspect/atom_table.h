//
// Copyright (c) 2006-present Benjamin Kaufmann
//
// This file is part of Aspect.
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//
#pragma once

#include <aspect/symbol.h>

#include <span>
#include <unordered_map>

/*!
 * \file
 * \brief The arena-indexed universe of ground atoms.
 */
namespace Aspect {
/*!
 * \addtogroup program
 */
//@{

//! Id of a ground atom. Ids are dense and assigned in insertion order.
using Atom_t = uint32_t;
//! Id of a predicate.
using Pred_t = uint32_t;
using AtomVec = std::vector<Atom_t>;

constexpr auto atom_none = static_cast<Atom_t>(-1);
constexpr auto pred_none = static_cast<Pred_t>(-1);

//! Maps ground atoms to integer ids and back.
/*!
 * The table owns all ground atoms of a program. Atoms are never removed, hence
 * the ids of a table are the integers [0, size()). Besides the primary map,
 * the table maintains for each predicate the list of its atoms and for each
 * argument position an index from symbols to atoms. All lists are sorted by
 * atom id, which allows restricting a lookup to a range of ids.
 */
class AtomTable {
public:
    AtomTable() = default;
    AtomTable(const AtomTable&)            = delete;
    AtomTable& operator=(const AtomTable&) = delete;
    AtomTable(AtomTable&&)                 = default;
    AtomTable& operator=(AtomTable&&)      = default;

    //! Returns the id of the predicate with the given signature, adding it if necessary.
    Pred_t                     addPredicate(std::string_view name, uint32_t arity);
    //! Returns the id of the given predicate or pred_none if it is unknown.
    [[nodiscard]] Pred_t       findPredicate(std::string_view name, uint32_t arity) const;
    [[nodiscard]] const Sig&   predicate(Pred_t p) const;
    [[nodiscard]] uint32_t     numPredicates() const { return size32(preds_); }

    //! Adds the atom p(args) if it is not yet in the table.
    /*!
     * \return The id of the atom and whether it was newly added.
     * \pre p < numPredicates() && args.size() == predicate(p).arity
     */
    std::pair<Atom_t, bool>    add(Pred_t p, SymVec args);
    //! Returns the id of p(args) or atom_none if no such atom exists.
    [[nodiscard]] Atom_t       find(Pred_t p, const SymVec& args) const;
    [[nodiscard]] Atom_t       find(std::string_view name, const SymVec& args) const;
    [[nodiscard]] bool         contains(Atom_t a) const { return a < size(); }

    [[nodiscard]] uint32_t              size() const { return size32(atoms_); }
    [[nodiscard]] Pred_t                pred(Atom_t a) const { return atoms_[a].pred; }
    [[nodiscard]] const std::string&    name(Atom_t a) const { return preds_[pred(a)].sig.name; }
    [[nodiscard]] const SymVec&         args(Atom_t a) const { return atoms_[a].args; }
    //! Returns all atoms of predicate p in id order.
    [[nodiscard]] std::span<const Atom_t> atoms(Pred_t p) const;
    //! Returns all atoms of predicate p with value v at argument position pos in id order.
    [[nodiscard]] std::span<const Atom_t> atoms(Pred_t p, uint32_t pos, const Symbol& v) const;

    //! Lexicographic order on atoms: by predicate name, arity, and argument tuple.
    [[nodiscard]] bool less(Atom_t lhs, Atom_t rhs) const;

    void                      print(std::ostream& os, Atom_t a) const;
    [[nodiscard]] std::string toString(Atom_t a) const;

private:
    struct AtomData {
        Pred_t pred;
        SymVec args;
    };
    struct PredData {
        Sig                                                        sig;
        AtomVec                                                    atoms;
        std::vector<std::unordered_map<Symbol, AtomVec, SymbolHash>> index; // one map per argument position
    };
    struct SigKey {
        std::string name;
        uint32_t    arity;
        bool        operator==(const SigKey&) const = default;
    };
    struct SigHash {
        std::size_t operator()(const SigKey& k) const noexcept;
    };
    using AtomMap = std::unordered_map<SymVec, Atom_t, SymVecHash>;

    std::vector<AtomData>                        atoms_;
    std::vector<PredData>                        preds_;
    std::vector<AtomMap>                         lookup_; // per predicate
    std::unordered_map<SigKey, Pred_t, SigHash>  sigs_;
};

//@}
} // namespace Aspect
