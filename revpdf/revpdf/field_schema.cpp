#include "pch.h"
#include "parse.h"
#include "field_schema.h"

struct FieldRow
{
	char const * type;
	char const * name;
	bool required;
	char const * defaultValue;	// PDF syntax, 0 for none
	char const * minVersion;
	char const * nestedType;
};

static FieldRow const standardFields[] =
{
	{ "Catalog", "Type", true, "/Catalog", "1.0", "" },
	{ "Catalog", "Version", false, 0, "1.4", "" },
	{ "Catalog", "Extensions", false, 0, "1.7", "" },
	{ "Catalog", "Pages", false, 0, "1.0", "Pages" },
	{ "Catalog", "PageLabels", false, 0, "1.3", "" },
	{ "Catalog", "Names", false, 0, "1.2", "Names" },
	{ "Catalog", "Dests", false, 0, "1.1", "" },
	{ "Catalog", "ViewerPreferences", false, 0, "1.2", "ViewerPreferences" },
	{ "Catalog", "PageLayout", false, "/SinglePage", "1.0", "" },
	{ "Catalog", "PageMode", false, "/UseNone", "1.0", "" },
	{ "Catalog", "Outlines", false, 0, "1.0", "Outlines" },
	{ "Catalog", "Threads", false, 0, "1.1", "" },
	{ "Catalog", "OpenAction", false, 0, "1.1", "" },
	{ "Catalog", "AA", false, 0, "1.4", "" },
	{ "Catalog", "URI", false, 0, "1.1", "" },
	{ "Catalog", "AcroForm", false, 0, "1.2", "" },
	{ "Catalog", "Metadata", false, 0, "1.4", "" },
	{ "Catalog", "StructTreeRoot", false, 0, "1.3", "" },
	{ "Catalog", "MarkInfo", false, 0, "1.4", "" },
	{ "Catalog", "Lang", false, 0, "1.4", "" },
	{ "Catalog", "SpiderInfo", false, 0, "1.3", "" },
	{ "Catalog", "OutputIntents", false, 0, "1.4", "" },
	{ "Catalog", "PieceInfo", false, 0, "1.4", "" },
	{ "Catalog", "OCProperties", false, 0, "1.5", "" },
	{ "Catalog", "Perms", false, 0, "1.5", "" },
	{ "Catalog", "Legal", false, 0, "1.5", "" },
	{ "Catalog", "Requirements", false, 0, "1.7", "" },
	{ "Catalog", "Collection", false, 0, "1.7", "" },
	{ "Catalog", "NeedsRendering", false, 0, "1.7", "" },

	{ "Pages", "Type", true, "/Pages", "1.0", "" },
	{ "Pages", "Parent", false, 0, "1.0", "Pages" },
	{ "Pages", "Kids", true, "[]", "1.0", "" },
	{ "Pages", "Count", true, "0", "1.0", "" },
	{ "Pages", "Resources", false, 0, "1.0", "Resources" },
	{ "Pages", "MediaBox", false, 0, "1.0", "" },
	{ "Pages", "CropBox", false, 0, "1.0", "" },
	{ "Pages", "Rotate", false, 0, "1.0", "" },

	{ "Page", "Type", true, "/Page", "1.0", "" },
	{ "Page", "Parent", true, 0, "1.0", "Pages" },
	{ "Page", "LastModified", false, 0, "1.3", "" },
	{ "Page", "Resources", false, 0, "1.0", "Resources" },
	{ "Page", "MediaBox", false, 0, "1.0", "" },
	{ "Page", "CropBox", false, 0, "1.0", "" },
	{ "Page", "BleedBox", false, 0, "1.3", "" },
	{ "Page", "TrimBox", false, 0, "1.3", "" },
	{ "Page", "ArtBox", false, 0, "1.3", "" },
	{ "Page", "BoxColorInfo", false, 0, "1.4", "" },
	{ "Page", "Contents", false, 0, "1.0", "" },
	{ "Page", "Rotate", false, "0", "1.0", "" },
	{ "Page", "Group", false, 0, "1.4", "" },
	{ "Page", "Thumb", false, 0, "1.0", "" },
	{ "Page", "B", false, 0, "1.1", "" },
	{ "Page", "Dur", false, 0, "1.1", "" },
	{ "Page", "Trans", false, 0, "1.1", "" },
	{ "Page", "Annots", false, 0, "1.0", "" },
	{ "Page", "AA", false, 0, "1.2", "" },
	{ "Page", "Metadata", false, 0, "1.4", "" },
	{ "Page", "PieceInfo", false, 0, "1.3", "" },
	{ "Page", "StructParents", false, 0, "1.3", "" },
	{ "Page", "ID", false, 0, "1.3", "" },
	{ "Page", "PZ", false, 0, "1.3", "" },
	{ "Page", "SeparationInfo", false, 0, "1.3", "" },
	{ "Page", "Tabs", false, 0, "1.5", "" },
	{ "Page", "TemplateInstantiated", false, 0, "1.5", "" },
	{ "Page", "PresSteps", false, 0, "1.5", "" },
	{ "Page", "UserUnit", false, 0, "1.6", "" },
	{ "Page", "VP", false, 0, "1.6", "" },

	{ "Trailer", "Size", false, 0, "1.0", "" },
	{ "Trailer", "Prev", false, 0, "1.0", "" },
	{ "Trailer", "Root", false, 0, "1.0", "Catalog" },
	{ "Trailer", "Encrypt", false, 0, "1.0", "Encrypt" },
	{ "Trailer", "Info", false, 0, "1.0", "Info" },
	{ "Trailer", "ID", false, 0, "1.0", "" },
	{ "Trailer", "XRefStm", false, 0, "1.5", "" },

	{ "ViewerPreferences", "HideToolbar", false, "false", "1.0", "" },
	{ "ViewerPreferences", "HideMenubar", false, "false", "1.0", "" },
	{ "ViewerPreferences", "HideWindowUI", false, "false", "1.0", "" },
	{ "ViewerPreferences", "FitWindow", false, "false", "1.0", "" },
	{ "ViewerPreferences", "CenterWindow", false, "false", "1.0", "" },
	{ "ViewerPreferences", "DisplayDocTitle", false, "false", "1.4", "" },
	{ "ViewerPreferences", "NonFullScreenPageMode", false, "/UseNone", "1.0", "" },
	{ "ViewerPreferences", "Direction", false, "/L2R", "1.3", "" },
	{ "ViewerPreferences", "ViewArea", false, "/CropBox", "1.4", "" },
	{ "ViewerPreferences", "ViewClip", false, "/CropBox", "1.4", "" },
	{ "ViewerPreferences", "PrintArea", false, "/CropBox", "1.4", "" },
	{ "ViewerPreferences", "PrintClip", false, "/CropBox", "1.4", "" },
	{ "ViewerPreferences", "PrintScaling", false, "/AppDefault", "1.6", "" },
	{ "ViewerPreferences", "Duplex", false, 0, "1.7", "" },
	{ "ViewerPreferences", "PickTrayByPDFSize", false, 0, "1.7", "" },
	{ "ViewerPreferences", "PrintPageRange", false, 0, "1.7", "" },
	{ "ViewerPreferences", "NumCopies", false, 0, "1.7", "" },

	{ "Info", "Title", false, 0, "1.1", "" },
	{ "Info", "Author", false, 0, "1.0", "" },
	{ "Info", "Subject", false, 0, "1.1", "" },
	{ "Info", "Keywords", false, 0, "1.1", "" },
	{ "Info", "Creator", false, 0, "1.0", "" },
	{ "Info", "Producer", false, 0, "1.0", "" },
	{ "Info", "CreationDate", false, 0, "1.0", "" },
	{ "Info", "ModDate", false, 0, "1.0", "" },
	{ "Info", "Trapped", false, 0, "1.3", "" },

	{ "Outlines", "Type", false, "/Outlines", "1.0", "" },
	{ "Outlines", "First", false, 0, "1.0", "" },
	{ "Outlines", "Last", false, 0, "1.0", "" },
	{ "Outlines", "Count", false, 0, "1.0", "" },

	{ "Resources", "ExtGState", false, 0, "1.0", "" },
	{ "Resources", "ColorSpace", false, 0, "1.0", "" },
	{ "Resources", "Pattern", false, 0, "1.0", "" },
	{ "Resources", "Shading", false, 0, "1.3", "" },
	{ "Resources", "XObject", false, 0, "1.0", "" },
	{ "Resources", "Font", false, 0, "1.0", "" },
	{ "Resources", "ProcSet", false, 0, "1.0", "" },
	{ "Resources", "Properties", false, 0, "1.2", "" },

	{ "Names", "Dests", false, 0, "1.2", "" },
	{ "Names", "AP", false, 0, "1.3", "" },
	{ "Names", "JavaScript", false, 0, "1.3", "" },
	{ "Names", "Pages", false, 0, "1.3", "" },
	{ "Names", "Templates", false, 0, "1.3", "" },
	{ "Names", "IDS", false, 0, "1.3", "" },
	{ "Names", "URLS", false, 0, "1.3", "" },
	{ "Names", "EmbeddedFiles", false, 0, "1.4", "" },
	{ "Names", "AlternatePresentations", false, 0, "1.4", "" },
	{ "Names", "Renditions", false, 0, "1.5", "" },

	{ "XRef", "Type", true, "/XRef", "1.5", "" },
	{ "XRef", "Size", false, 0, "1.0", "" },
	{ "XRef", "Index", false, 0, "1.0", "" },
	{ "XRef", "Prev", false, 0, "1.0", "" },
	{ "XRef", "W", false, 0, "1.0", "" },

	{ "ObjStm", "Type", true, "/ObjStm", "1.5", "" },
	{ "ObjStm", "N", false, 0, "1.0", "" },
	{ "ObjStm", "First", false, 0, "1.0", "" },
	{ "ObjStm", "Extends", false, 0, "1.0", "" },

	{ "Encrypt", "Filter", true, 0, "1.0", "" },
	{ "Encrypt", "SubFilter", false, 0, "1.3", "" },
	{ "Encrypt", "V", true, 0, "1.0", "" },
	{ "Encrypt", "Length", false, "40", "1.4", "" },
	{ "Encrypt", "CF", false, 0, "1.5", "" },
	{ "Encrypt", "StmF", false, "/Identity", "1.5", "" },
	{ "Encrypt", "StrF", false, "/Identity", "1.5", "" },
	{ "Encrypt", "EFF", false, 0, "1.6", "" },
	{ "Encrypt", "R", true, 0, "1.0", "" },
	{ "Encrypt", "O", true, 0, "1.0", "" },
	{ "Encrypt", "OE", false, 0, "2.0", "" },
	{ "Encrypt", "U", true, 0, "1.0", "" },
	{ "Encrypt", "UE", false, 0, "2.0", "" },
	{ "Encrypt", "P", true, 0, "1.0", "" },
	{ "Encrypt", "Perms", false, 0, "2.0", "" },
	{ "Encrypt", "EncryptMetadata", false, "true", "1.5", "" },
};

static PObject ParseDefault( char const * text )
{
	if (!text)
		return PObject();

	char const * p = text;
	return Parse( p, text + strlen( text ) );
}

static FieldSchemaRegistry BuildStandard()
{
	FieldSchemaRegistry registry;
	for( size_t i = 0; i < sizeof( standardFields ) / sizeof( standardFields[0] ); i++ )
	{
		FieldRow const & row = standardFields[i];
		registry.Register( row.type, FieldSpec( row.name, row.required, ParseDefault( row.defaultValue ),
			row.minVersion, row.nestedType ) );
	}
	return registry;
}

FieldSchemaRegistry const & FieldSchemaRegistry::Standard()
{
	static FieldSchemaRegistry const standard = BuildStandard();
	return standard;
}

void FieldSchemaRegistry::Register( std::string const & type, FieldSpec const & field )
{
	std::vector<FieldSpec> & fields = schemas[type];
	for( std::vector<FieldSpec>::iterator it = fields.begin(); it != fields.end(); ++it )
		if (it->name == field.name)
		{
			*it = field;
			return;
		}

	fields.push_back( field );
}

std::vector<FieldSpec> const * FieldSchemaRegistry::Fields( std::string const & type ) const
{
	std::map< std::string, std::vector<FieldSpec> >::const_iterator it = schemas.find( type );
	return it == schemas.end() ? 0 : &it->second;
}

FieldSpec const * FieldSchemaRegistry::Field( std::string const & type, std::string const & name ) const
{
	std::vector<FieldSpec> const * fields = Fields( type );
	if (!fields)
		return 0;

	for( std::vector<FieldSpec>::const_iterator it = fields->begin(); it != fields->end(); ++it )
		if (it->name == name)
			return &*it;

	return 0;
}

std::string FieldSchemaRegistry::SchemaOf( Dictionary const & dict, std::string const & hint ) const
{
	PObject type = dict.Get( "Type" );
	if (type && type->Type() == ObjectType::Name && Has( ((Name *)type.get())->str.value ))
		return ((Name *)type.get())->str.value;

	return hint;
}

int CompareVersions( std::string const & a, std::string const & b )
{
	int majorA = 0, minorA = 0, majorB = 0, minorB = 0;
	sscanf( a.c_str(), "%d.%d", &majorA, &minorA );
	sscanf( b.c_str(), "%d.%d", &majorB, &minorB );

	if (majorA != majorB)
		return majorA < majorB ? -1 : 1;
	if (minorA != minorB)
		return minorA < minorB ? -1 : 1;
	return 0;
}

void InferSchemaTypes( Document const & doc, ObjectList const & objects,
	FieldSchemaRegistry const & registry, SchemaTypes & out )
{
	typedef std::pair<PDictionary, std::string> work_t;
	std::vector<work_t> work;
	std::set<Dictionary const *> done;

	work.push_back( work_t( doc.Trailer(), "Trailer" ) );

	for( ObjectList::const_iterator it = objects.begin(); it != objects.end(); ++it )
	{
		PDictionary dict = GetDictionary( it->first->value );
		if (dict && registry.Has( registry.SchemaOf( *dict, "" ) ))
			work.push_back( work_t( dict, registry.SchemaOf( *dict, "" ) ) );
	}

	while( !work.empty() )
	{
		work_t item = work.back();
		work.pop_back();

		if (!done.insert( item.first.get() ).second)
			continue;

		std::vector<FieldSpec> const * fields = registry.Fields( item.second );
		if (!fields)
			continue;

		for( std::vector<FieldSpec>::const_iterator field = fields->begin(); field != fields->end(); ++field )
		{
			if (field->nestedType.empty())
				continue;

			PObject value = item.first->Get( field->name.c_str() );
			if (!value)
				continue;

			PIndirectObject target;
			if (value->Type() == ObjectType::Ref)
				target = doc.GetObject( ((Indirect *)value.get())->Id() );
			else if (value->Type() == ObjectType::IndirectObject)
				target = boost::static_pointer_cast<IndirectObject>( value );

			PDictionary nested = GetDictionary( target ? target->value : value );
			if (!nested)
				continue;

			std::string schema = registry.SchemaOf( *nested, field->nestedType );
			if (target && !out.count( target.get() ))
				out[ target.get() ] = schema;

			work.push_back( work_t( nested, schema ) );
		}
	}
}
