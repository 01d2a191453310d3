/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */
/*                                                                           */
/*               This file is part of the program and library                */
/*                            BandClass                                      */
/*                                                                           */
/* Copyright (C) 2024             The BandClass Authors                      */
/*                                                                           */
/*  Licensed under the Apache License, Version 2.0 (the "License");          */
/*  you may not use this file except in compliance with the License.         */
/*  You may obtain a copy of the License at                                  */
/*                                                                           */
/*      http://www.apache.org/licenses/LICENSE-2.0                           */
/*                                                                           */
/*  Unless required by applicable law or agreed to in writing, software      */
/*  distributed under the License is distributed on an "AS IS" BASIS,        */
/*  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. */
/*  See the License for the specific language governing permissions and      */
/*  limitations under the License.                                           */
/*                                                                           */
/*  You should have received a copy of the Apache-2.0 license                */
/*  along with BandClass; see the file LICENSE. If not visit                 */
/*  https://www.apache.org/licenses/LICENSE-2.0.                             */
/*                                                                           */
/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

#ifndef _BANDCLASS_CORE_CONSTRAINT_MATRIX_HPP_
#define _BANDCLASS_CORE_CONSTRAINT_MATRIX_HPP_

#include "bandclass/data/RowFlags.hpp"
#include "bandclass/misc/Vec.hpp"
#include <algorithm>
#include <cassert>
#include <utility>

namespace bandclass
{

template <typename REAL>
struct MatrixEntry
{
   int row;
   int col;
   REAL val;

   MatrixEntry( int _row, int _col, const REAL& _val )
       : row( _row ), col( _col ), val( _val )
   {
   }
};

/// non-owning view on the nonzeros of one row
template <typename REAL>
class SparseVectorView
{
 public:
   SparseVectorView( const int* _indices, const REAL* _values, int _length )
       : indices( _indices ), values( _values ), length( _length )
   {
   }

   const int*
   getIndices() const
   {
      return indices;
   }

   const REAL*
   getValues() const
   {
      return values;
   }

   int
   getLength() const
   {
      return length;
   }

 private:
   const int* indices;
   const REAL* values;
   int length;
};

/// collects unordered (row,col,val) triplets; duplicate positions are summed
template <typename REAL>
class MatrixBuffer
{
 public:
   void
   addEntry( int row, int col, const REAL& val )
   {
      entries.emplace_back( row, col, val );
   }

   void
   reserve( int nnz )
   {
      entries.reserve( nnz );
   }

   void
   clear()
   {
      entries.clear();
   }

   /// sorts the triplets row-wise and compresses them into the given arrays
   void
   buildCSR( int nrows, Vec<int>& rowstart, Vec<int>& colindices,
             Vec<REAL>& values )
   {
      std::sort( entries.begin(), entries.end(),
                 []( const MatrixEntry<REAL>& a, const MatrixEntry<REAL>& b ) {
                    return a.row < b.row || ( a.row == b.row && a.col < b.col );
                 } );

      rowstart.assign( nrows + 1, 0 );
      colindices.clear();
      values.clear();
      colindices.reserve( entries.size() );
      values.reserve( entries.size() );

      for( const auto& entry : entries )
      {
         assert( entry.row >= 0 && entry.row < nrows );
         if( !colindices.empty() && rowstart[entry.row + 1] > 0 &&
             colindices.back() == entry.col )
         {
            values.back() += entry.val;
            continue;
         }
         colindices.push_back( entry.col );
         values.push_back( entry.val );
         ++rowstart[entry.row + 1];
      }

      for( int row = 0; row < nrows; ++row )
         rowstart[row + 1] += rowstart[row];
   }

 private:
   Vec<MatrixEntry<REAL>> entries;
};

/// row-wise sparse constraint matrix with left and right hand sides
template <typename REAL>
class ConstraintMatrix
{
 public:
   ConstraintMatrix() = default;

   ConstraintMatrix( MatrixBuffer<REAL>& buffer, int _ncols, Vec<REAL> _lhs,
                     Vec<REAL> _rhs, Vec<RowFlags> _flags )
       : ncols( _ncols ), lhs( std::move( _lhs ) ), rhs( std::move( _rhs ) ),
         flags( std::move( _flags ) )
   {
      assert( lhs.size() == rhs.size() );
      assert( lhs.size() == flags.size() );
      buffer.buildCSR( static_cast<int>( lhs.size() ), rowstart, colindices,
                       values );
   }

   SparseVectorView<REAL>
   getRowCoefficients( int row ) const
   {
      return SparseVectorView<REAL>( colindices.data() + rowstart[row],
                                     values.data() + rowstart[row],
                                     rowstart[row + 1] - rowstart[row] );
   }

   int
   getNRows() const
   {
      return static_cast<int>( lhs.size() );
   }

   int
   getNCols() const
   {
      return ncols;
   }

   int
   getNnz() const
   {
      return static_cast<int>( values.size() );
   }

   const Vec<REAL>&
   getLeftHandSides() const
   {
      return lhs;
   }

   const Vec<REAL>&
   getRightHandSides() const
   {
      return rhs;
   }

   const Vec<RowFlags>&
   getRowFlags() const
   {
      return flags;
   }

   Vec<RowFlags>&
   getRowFlags()
   {
      return flags;
   }

 private:
   int ncols = 0;
   Vec<int> rowstart { 0 };
   Vec<int> colindices;
   Vec<REAL> values;
   Vec<REAL> lhs;
   Vec<REAL> rhs;
   Vec<RowFlags> flags;
};

} // namespace bandclass

#endif
