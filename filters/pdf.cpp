//  pdf.cpp -- PDF image format support
//  Copyright (C) 2012, 2015  SEIKO EPSON CORPORATION
//  Copyright (C) 2026  scan2pdf developers
//
//  License: GPL-3.0+
//  Author : EPSON AVASYS CORPORATION
//
//  This file is part of the 'scan2pdf' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <sstream>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include <scan2pdf/format.hpp>
#include <scan2pdf/log.hpp>

#include "pdf.hpp"
#include "pdf/dictionary.hpp"
#include "pdf/primitive.hpp"

namespace scan2pdf {
namespace _flt_ {

using _pdf_::array;
using _pdf_::dictionary;
using _pdf_::primitive;
using _pdf_::reference;

namespace {

const double points_per_inch = 72.0;

//! Image size in PDF default user space units
double
points (context::size_type pixels, context::size_type resolution)
{
  if (0 >= resolution) resolution = points_per_inch;
  return (points_per_inch * pixels) / resolution;
}

std::string
image_name (context::size_type page)
{
  std::ostringstream ss;
  ss << "Im" << page;
  return ss.str ();
}

}       // namespace

pdf::pdf ()
  : info_num_(0)
  , catalog_num_(0)
  , pages_num_(0)
  , image_num_(0)
  , height_num_(0)
  , preamble_pending_(false)
{}

streamsize
pdf::write (const octet *data, streamsize n)
{
  if (!data || 0 >= n) return 0;

  doc_.write (data, n);
  doc_.flush (*output_);

  return n;
}

context::size_type
pdf::page_count () const
{
  return kids_.size ();
}

//! Starts a new document
/*! Nothing is output yet because the output device only starts its
 *  sequence after this filter has seen bos.  The document preamble
 *  goes out with the first page or, for an empty sequence, at eos.
 */
void
pdf::bos (const context& ctx)
{
  doc_.reset ();
  kids_ = array ();

  info_num_    = doc_.reserve ();
  catalog_num_ = doc_.reserve ();
  pages_num_   = doc_.reserve ();
  preamble_pending_ = true;

  ctx_ = ctx;
  ctx_.content_type ("application/pdf");
}

void
pdf::write_preamble ()
{
  if (!preamble_pending_) return;

  doc_.header ();

  dictionary info;
  info.insert ("Producer", primitive::text (PACKAGE_STRING));
  info.insert ("Creator", primitive::text (PACKAGE_STRING));
  doc_.write (info_num_, info);

  dictionary catalog;
  catalog.insert ("Type", primitive::name ("Catalog"));
  catalog.insert ("Pages", reference (pages_num_));
  doc_.write (catalog_num_, catalog);

  preamble_pending_ = false;
}

void
pdf::boi (const context& ctx)
{
  content_type_ = ctx.content_type ();

  bool supported = false;
  /**/ if ("image/jpeg" == content_type_)
    supported = (8 == ctx.depth ());
  else if ("image/x-raster" == content_type_)
    supported = (1 == ctx.depth () || 8 == ctx.depth ());

  if (!supported)
    {
      BOOST_THROW_EXCEPTION
        (std::logic_error
         ((format ("PDF filter cannot embed %1% data at %2% bits")
           % content_type_ % ctx.depth ()).str ()));
    }

  ctx_ = ctx;
  ctx_.content_type ("application/pdf");

  write_preamble ();
  write_image_header (ctx);
  doc_.flush (*output_);
}

void
pdf::eoi (const context& ctx)
{
  doc_.end_stream ();
  doc_.write (height_num_, primitive (ctx.height ()));

  ctx_ = ctx;
  ctx_.content_type ("application/pdf");

  write_page (ctx);
  doc_.flush (*output_);

  log::debug ("PDF page %1% completed, %2% octets so far")
    % page_count () % doc_.octets_seen ();
}

void
pdf::eos (const context& ctx)
{
  write_preamble ();

  dictionary pages;
  pages.insert ("Type", primitive::name ("Pages"));
  pages.insert ("Kids", kids_);
  pages.insert ("Count", primitive (kids_.size ()));
  doc_.write (pages_num_, pages);

  dictionary trailer;
  trailer.insert ("Root", reference (catalog_num_));
  trailer.insert ("Info", reference (info_num_));
  doc_.trailer (trailer);

  doc_.flush (*output_);
}

//! Starts the image XObject for the next page
/*! The image height is output as a separate object once the image
 *  is complete so it is correct even if the image was cut short.
 */
void
pdf::write_image_header (const context& ctx)
{
  image_num_  = doc_.reserve ();
  height_num_ = doc_.reserve ();

  dictionary image;
  image.insert ("Type", primitive::name ("XObject"));
  image.insert ("Subtype", primitive::name ("Image"));
  image.insert ("Name", primitive::name (image_name (page_count ())));
  image.insert ("Width", primitive (ctx.width ()));
  image.insert ("Height", reference (height_num_));
  image.insert ("ColorSpace",
                primitive::name (ctx.is_rgb () ? "DeviceRGB" : "DeviceGray"));
  image.insert ("BitsPerComponent", primitive (ctx.depth ()));

  if ("image/jpeg" == content_type_)
    {
      image.insert ("Filter", primitive::name ("DCTDecode"));
    }
  else if (1 == ctx.depth ())
    {
      array decode;
      decode.insert (primitive (1));
      decode.insert (primitive (0));
      image.insert ("Decode", decode);
    }

  doc_.begin_stream (image_num_, image);
}

void
pdf::write_page (const context& ctx)
{
  const double width  = points (ctx.width (), ctx.resolution ());
  const double height = points (ctx.height (), ctx.resolution ());
  const std::string name (image_name (page_count ()));

  std::size_t page_num     = doc_.reserve ();
  std::size_t contents_num = doc_.reserve ();

  std::ostringstream ss;
  ss << "q\n"
     << width << " 0 0 " << height << " 0 0 cm\n"
     << "/" << name << " Do\n"
     << "Q";

  doc_.begin_stream (contents_num, dictionary ());
  doc_.write (ss.str ());
  doc_.end_stream ();

  dictionary xobjects;
  xobjects.insert (name, reference (image_num_));

  array procset;
  procset.insert (primitive::name ("PDF"));
  procset.insert (primitive::name (ctx.is_rgb () ? "ImageC" : "ImageB"));

  dictionary resources;
  resources.insert ("XObject", xobjects);
  resources.insert ("ProcSet", procset);

  array mbox;
  mbox.insert (primitive (0));
  mbox.insert (primitive (0));
  mbox.insert (primitive (width));
  mbox.insert (primitive (height));

  dictionary page;
  page.insert ("Type", primitive::name ("Page"));
  page.insert ("Parent", reference (pages_num_));
  page.insert ("MediaBox", mbox);
  page.insert ("Resources", resources);
  page.insert ("Contents", reference (contents_num));
  doc_.write (page_num, page);

  kids_.insert (reference (page_num));
}

}       // namespace _flt_
}       // namespace scan2pdf
